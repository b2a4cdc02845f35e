// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace reel::core {

// Half-open byte range [start, end). An open-ended range covers the whole
// resource when its size is unknown; `end` is then meaningless.
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    bool open_ended{false};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }

    bool operator==(const ByteRange&) const = default;
};

// Split [0, total_size) into ceil(total_size / chunk_size) contiguous ranges,
// the last one possibly shorter. total_size == 0 means the size is unknown and
// yields a single open-ended range. Deterministic for equal inputs.
[[nodiscard]] std::expected<std::vector<ByteRange>, std::error_code>
plan_segments(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

// Number of segments plan_segments would produce
[[nodiscard]] constexpr std::uint64_t segment_count(std::uint64_t total_size,
                                                    std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0) return 0;
    if (total_size == 0) return 1;
    return (total_size + chunk_size - 1) / chunk_size;
}

} // namespace reel::core
