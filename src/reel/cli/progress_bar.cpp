// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reel::cli {

namespace {

constexpr int BAR_WIDTH = 30;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total) noexcept {
    auto now = std::chrono::steady_clock::now();
    if (!started_) {
        started_ = true;
        start_ = now;
        first_bytes_ = current;
    }
    last_current_ = current;
    last_total_ = total;

    double percent = 0.0;
    if (total > 0) {
        percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
    }

    // Only redraw on a visible change (every 0.1%)
    int permille = static_cast<int>(percent * 10.0);
    if (permille == last_permille_ && !finished_ && total > 0) return;
    last_permille_ = permille;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total > 0) {
        line += render_bar(percent);
        line += " ";
        line += fixed(percent, 1);
        line += "% (";
        line += format_bytes(current);
        line += "/";
        line += format_bytes(total);
        line += ")";
    } else {
        line += format_bytes(current);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
    if (elapsed > 500 && current > first_bytes_) {
        auto bps = static_cast<std::uint64_t>((current - first_bytes_) * 1000 / static_cast<std::uint64_t>(elapsed));
        line += " @ ";
        line += format_speed(bps);
        if (bps > 0 && total > current) {
            line += " ETA: ";
            line += format_time((total - current) / bps);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(last_total_ > 0 ? last_total_ : last_current_, last_total_);
    std::cout << std::endl;
}

void ProgressBar::clear_line() noexcept {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    bar += "]";
    return bar;
}

//=============================================================================
// Formatting
//=============================================================================

std::string format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace reel::cli
