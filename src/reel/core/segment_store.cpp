// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/segment_store.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <reel/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

constexpr int PLAN_FORMAT_VERSION = 1;

nlohmann::json to_json_doc(const SegmentPlan& plan) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& seg : plan.segments) {
        segments.push_back({
            {"index", seg.index},
            {"start", seg.range.start},
            {"end", seg.range.end},
            {"openEnded", seg.range.open_ended},
            {"received", seg.bytes_received},
            {"complete", seg.complete},
        });
    }
    return {
        {"version", PLAN_FORMAT_VERSION},
        {"videoId", plan.video_id},
        {"remoteURL", plan.locator},
        {"totalSize", plan.total_size},
        {"chunkSize", plan.chunk_size},
        {"segments", std::move(segments)},
    };
}

SegmentPlan from_json_doc(const nlohmann::json& j) {
    SegmentPlan plan;
    j.at("videoId").get_to(plan.video_id);
    j.at("remoteURL").get_to(plan.locator);
    j.at("totalSize").get_to(plan.total_size);
    j.at("chunkSize").get_to(plan.chunk_size);

    for (const auto& s : j.at("segments")) {
        SegmentRecord seg;
        s.at("index").get_to(seg.index);
        s.at("start").get_to(seg.range.start);
        s.at("end").get_to(seg.range.end);
        seg.range.open_ended = s.value("openEnded", false);
        s.at("received").get_to(seg.bytes_received);
        s.at("complete").get_to(seg.complete);
        plan.segments.push_back(seg);
    }
    return plan;
}

bool plan_consistent(const SegmentPlan& plan) noexcept {
    for (std::size_t i = 0; i < plan.segments.size(); ++i) {
        const auto& seg = plan.segments[i];
        if (seg.index != i) return false;
        if (!seg.range.open_ended) {
            if (seg.range.end < seg.range.start) return false;
            if (seg.bytes_received > seg.range.length()) return false;
        }
    }
    return true;
}

} // namespace

//=============================================================================
// SegmentPlan
//=============================================================================

std::uint64_t SegmentPlan::bytes_received() const noexcept {
    std::uint64_t sum = 0;
    for (const auto& seg : segments) {
        sum += seg.bytes_received;
    }
    return sum;
}

bool SegmentPlan::all_complete() const noexcept {
    if (segments.empty()) return false;
    for (const auto& seg : segments) {
        if (!seg.complete) return false;
    }
    return true;
}

std::expected<SegmentPlan, std::error_code>
SegmentPlan::create(std::string video_id, std::string locator,
                    std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    auto ranges = plan_segments(total_size, chunk_size);
    if (!ranges) {
        return std::unexpected(ranges.error());
    }

    SegmentPlan plan;
    plan.video_id = std::move(video_id);
    plan.locator = std::move(locator);
    plan.total_size = total_size;
    plan.chunk_size = chunk_size;
    plan.segments.reserve(ranges->size());

    std::uint32_t index = 0;
    for (const auto& range : *ranges) {
        SegmentRecord seg;
        seg.index = index++;
        seg.range = range;
        plan.segments.push_back(seg);
    }
    return plan;
}

//=============================================================================
// SegmentStore
//=============================================================================

SegmentStore::SegmentStore(std::string dir)
    : dir_(std::move(dir)) {
}

std::string SegmentStore::plan_path(std::string_view video_id) const {
    return (fs::path(dir_) / (disk::sanitize_file_name(video_id) + ".json")).string();
}

std::error_code SegmentStore::save(const SegmentPlan& plan) const noexcept {
    try {
        return disk::write_file_atomic(plan_path(plan.video_id), to_json_doc(plan).dump(2));
    } catch (const std::exception& e) {
        spdlog::error("[{}] could not serialize segment plan: {}", plan.video_id, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<SegmentPlan, std::error_code>
SegmentStore::load(std::string_view video_id) const noexcept {
    try {
        std::ifstream file(plan_path(video_id), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto plan = from_json_doc(nlohmann::json::parse(file));
        if (plan.video_id != video_id || !plan_consistent(plan)) {
            spdlog::warn("[{}] segment plan on disk is inconsistent", video_id);
            return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
        }
        return plan;
    } catch (const std::exception& e) {
        spdlog::warn("[{}] could not read segment plan: {}", video_id, e.what());
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    }
}

bool SegmentStore::exists(std::string_view video_id) const noexcept {
    try {
        std::error_code ec;
        return fs::exists(plan_path(video_id), ec);
    } catch (const std::exception&) {
        return false;
    }
}

std::error_code SegmentStore::remove(std::string_view video_id) const noexcept {
    try {
        return disk::remove_file(plan_path(video_id));
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::invalid_path);
    }
}

std::vector<std::string> SegmentStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() != ".json") continue;
        auto plan = load(p.stem().string());
        if (plan) {
            ids.push_back(plan->video_id);
        }
    }
    return ids;
}

std::error_code SegmentStore::clear() const noexcept {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    return ec;
}

//=============================================================================
// Segment files
//=============================================================================

std::string segment_file_path(std::string_view segment_dir,
                              std::string_view video_id,
                              std::uint32_t index) {
    auto name = disk::sanitize_file_name(video_id) + "_part" + std::to_string(index) + ".tmp";
    return (fs::path(segment_dir) / name).string();
}

bool sync_with_files(SegmentPlan& plan, std::string_view segment_dir) noexcept {
    bool changed = false;
    try {
        for (auto& seg : plan.segments) {
            auto on_disk = disk::file_size(segment_file_path(segment_dir, plan.video_id, seg.index));

            if (on_disk < seg.bytes_received) {
                spdlog::warn("[{}] segment {} has {} bytes on disk, record says {}",
                             plan.video_id, seg.index, on_disk, seg.bytes_received);
                seg.bytes_received = on_disk;
                seg.complete = false;
                changed = true;
            }
            if (seg.complete && !seg.range.open_ended && seg.bytes_received != seg.range.length()) {
                seg.complete = false;
                changed = true;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] could not inspect segment files: {}", plan.video_id, e.what());
    }
    return changed;
}

void remove_segment_files(std::string_view segment_dir, std::string_view video_id) noexcept {
    try {
        const auto prefix = disk::sanitize_file_name(video_id) + "_part";
        std::error_code ec;
        for (fs::directory_iterator it(fs::path(segment_dir), ec), end; !ec && it != end; it.increment(ec)) {
            const auto name = it->path().filename().string();
            if (!name.starts_with(prefix) || !name.ends_with(".tmp")) continue;
            // Digits only between prefix and extension; ids sharing a prefix stay apart
            auto digits = std::string_view(name).substr(prefix.size(), name.size() - prefix.size() - 4);
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string_view::npos) continue;

            if (auto rm = disk::remove_file(it->path().string()); rm) {
                spdlog::warn("[{}] could not delete {}: {}", video_id, name, rm.message());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] could not delete segment files: {}", video_id, e.what());
    }
}

} // namespace reel::core
