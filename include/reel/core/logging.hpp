// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace reel::log {

// Install the "reel" logger (stderr, plus a file sink when file is non-empty)
// as the spdlog default. Safe to call more than once.
void init(std::string_view level, std::string_view file = {}) noexcept;

// Adjust the level of the default logger
void set_level(std::string_view level) noexcept;

} // namespace reel::log
