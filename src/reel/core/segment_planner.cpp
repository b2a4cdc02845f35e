// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/segment_planner.hpp>
#include <algorithm>
#include <new>

namespace reel::core {

std::expected<std::vector<ByteRange>, std::error_code>
plan_segments(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    std::vector<ByteRange> ranges;

    if (total_size == 0) {
        ranges.push_back(ByteRange{0, 0, true});
        return ranges;
    }

    try {
        ranges.reserve(static_cast<std::size_t>(segment_count(total_size, chunk_size)));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    std::uint64_t offset = 0;
    while (offset < total_size) {
        std::uint64_t this_size = std::min(chunk_size, total_size - offset);
        ranges.push_back(ByteRange{offset, offset + this_size, false});
        offset += this_size;
    }

    return ranges;
}

} // namespace reel::core
