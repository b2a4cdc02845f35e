// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/tracking_store.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <reel/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace reel::core {

TrackingStore::TrackingStore(std::string path)
    : path_(std::move(path)) {
}

std::error_code TrackingStore::open() noexcept {
    records_.clear();
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return {};
        }

        auto doc = nlohmann::json::parse(file);
        for (const auto& item : doc.at("downloads")) {
            auto record = item.get<TrackedDownload>();
            if (!record.valid()) {
                spdlog::warn("[{}] tracked record violates its invariants, resetting", record.id());
                record = TrackedDownload::from_remote(record.video);
            }
            records_.insert_or_assign(record.id(), std::move(record));
        }
        spdlog::debug("loaded {} tracked downloads from {}", records_.size(), path_);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("could not read {}: {}", path_, e.what());
        records_.clear();
        return make_error_code(DownloadErrc::corrupt_state);
    }
}

std::optional<TrackedDownload> TrackingStore::get(std::string_view id) const {
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

bool TrackingStore::contains(std::string_view id) const noexcept {
    return records_.find(id) != records_.end();
}

std::vector<TrackedDownload> TrackingStore::all() const {
    std::vector<TrackedDownload> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record);
    }
    return out;
}

std::error_code TrackingStore::put(const TrackedDownload& record) noexcept {
    try {
        records_.insert_or_assign(record.id(), record);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return persist();
}

std::error_code TrackingStore::erase(std::string_view id) noexcept {
    auto it = records_.find(id);
    if (it == records_.end()) return {};
    records_.erase(it);
    return persist();
}

std::error_code TrackingStore::clear() noexcept {
    records_.clear();
    return disk::remove_file(path_);
}

std::error_code TrackingStore::persist() const noexcept {
    try {
        nlohmann::json downloads = nlohmann::json::array();
        for (const auto& [id, record] : records_) {
            downloads.push_back(record);
        }
        nlohmann::json doc{{"version", 1}, {"downloads", std::move(downloads)}};

        auto ec = disk::write_file_atomic(path_, doc.dump(2));
        if (ec) {
            spdlog::error("could not write {}: {}", path_, ec.message());
        }
        return ec;
    } catch (const std::exception& e) {
        spdlog::error("could not serialize tracked downloads: {}", e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace reel::core
