// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reel::disk {

constexpr std::size_t MERGE_BUFFER_SIZE = 256 * 1024;  // 256 KB

// Concatenate parts in order into output. The result is written under a
// temporary name and renamed into place only once its length is verified, so
// a failed merge never leaves a truncated output. Parts are left untouched.
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
merge_files(const std::vector<std::string>& parts,
            std::string_view output,
            std::optional<std::uint64_t> expected_length) noexcept;

} // namespace reel::disk
