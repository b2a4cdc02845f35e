// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Redraw with current/total bytes; speed is measured from the first update
    void update(std::uint64_t current, std::uint64_t total) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept { clear_line(); }
    static void clear_line() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    std::chrono::steady_clock::time_point start_;
    std::uint64_t first_bytes_{0};
    std::uint64_t last_current_{0};
    std::uint64_t last_total_{0};
    int last_permille_{-1};
    bool started_{false};
    bool finished_{false};
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace reel::cli
