// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/segment_planner.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::core {

// Persisted state of one segment
struct SegmentRecord {
    std::uint32_t index{0};
    ByteRange range;
    std::uint64_t bytes_received{0};
    bool complete{false};

    bool operator==(const SegmentRecord&) const = default;
};

// Segment plan of one video: the authoritative resume point
struct SegmentPlan {
    std::string video_id;
    std::string locator;            // Locator the plan is fetching from
    std::uint64_t total_size{0};    // 0 when planned without a known size
    std::uint64_t chunk_size{0};
    std::vector<SegmentRecord> segments;

    [[nodiscard]] std::uint64_t bytes_received() const noexcept;
    [[nodiscard]] bool all_complete() const noexcept;
    [[nodiscard]] bool has_partial_data() const noexcept { return bytes_received() > 0; }

    // Build a fresh plan with every record at zero bytes
    [[nodiscard]] static std::expected<SegmentPlan, std::error_code>
    create(std::string video_id, std::string locator,
           std::uint64_t total_size, std::uint64_t chunk_size) noexcept;
};

// Stores one JSON document per video under a directory
class SegmentStore {
public:
    explicit SegmentStore(std::string dir);

    [[nodiscard]] const std::string& dir() const noexcept { return dir_; }
    [[nodiscard]] std::string plan_path(std::string_view video_id) const;

    [[nodiscard]] std::error_code save(const SegmentPlan& plan) const noexcept;

    [[nodiscard]] std::expected<SegmentPlan, std::error_code>
    load(std::string_view video_id) const noexcept;

    [[nodiscard]] bool exists(std::string_view video_id) const noexcept;

    [[nodiscard]] std::error_code remove(std::string_view video_id) const noexcept;

    // Ids with a persisted plan
    [[nodiscard]] std::vector<std::string> list() const;

    [[nodiscard]] std::error_code clear() const noexcept;

private:
    std::string dir_;
};

// Path of the temporary file backing one segment
[[nodiscard]] std::string segment_file_path(std::string_view segment_dir,
                                            std::string_view video_id,
                                            std::uint32_t index);

// Align records with the segment files actually on disk. A file shorter than
// its record (lost tail after a crash) lowers the record; a record marked
// complete whose file is short is reopened. Returns true if anything changed.
bool sync_with_files(SegmentPlan& plan, std::string_view segment_dir) noexcept;

// Delete every segment file of a video, with or without a plan; failures are logged
void remove_segment_files(std::string_view segment_dir, std::string_view video_id) noexcept;

} // namespace reel::core
