// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/segment_planner.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>

namespace reel::core {

// One segment transfer to perform
struct SegmentJob {
    std::string video_id;
    std::uint32_t index{0};
    ByteRange range;
    std::uint64_t received{0};   // Bytes already on disk for this segment
    std::string url;
    std::string file_path;
};

// Called with the segment's absolute byte count
using SegmentProgressFn = std::function<void(std::uint64_t received)>;

// Downloads one byte range into its segment file. Resumes at job.received,
// never retries, never writes past the range.
class SegmentFetcher {
public:
    SegmentFetcher(Transport& transport, std::chrono::milliseconds progress_interval) noexcept
        : transport_(transport)
        , progress_interval_(progress_interval) {}

    // Returns the segment's total received bytes once it is complete
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch(const SegmentJob& job, std::stop_token stop, const SegmentProgressFn& on_progress) const noexcept;

private:
    Transport& transport_;
    std::chrono::milliseconds progress_interval_;
};

} // namespace reel::core
