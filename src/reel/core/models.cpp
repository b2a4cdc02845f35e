// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/models.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

namespace reel::core {

namespace {

constexpr std::string_view PROCESSED_STATUS = "POST_PROCESSING_SUCCESS";

} // namespace

std::string_view to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::not_started: return "notStarted";
        case DownloadStatus::downloading: return "downloading";
        case DownloadStatus::paused:      return "paused";
        case DownloadStatus::completed:   return "completed";
        case DownloadStatus::error:       return "error";
    }
    return "notStarted";
}

std::optional<DownloadStatus> status_from_string(std::string_view s) noexcept {
    if (s == "notStarted")  return DownloadStatus::not_started;
    if (s == "downloading") return DownloadStatus::downloading;
    if (s == "paused")      return DownloadStatus::paused;
    if (s == "completed")   return DownloadStatus::completed;
    if (s == "error")       return DownloadStatus::error;
    return std::nullopt;
}

double TrackedDownload::fraction() const noexcept {
    if (total_bytes == 0) return 0.0;
    return std::min(1.0, static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes));
}

bool TrackedDownload::valid() const noexcept {
    if (total_bytes > 0 && downloaded_bytes > total_bytes) return false;
    if (status == DownloadStatus::completed && downloaded_bytes != total_bytes) return false;
    if ((status == DownloadStatus::error) != error_message.has_value()) return false;
    return true;
}

TrackedDownload TrackedDownload::from_remote(const RemoteVideo& video) {
    TrackedDownload d;
    d.video = video;
    d.total_bytes = video.size_bytes.value_or(0);
    d.source_locator_snapshot = video.source_locator;
    return d;
}

//=============================================================================
// JSON
//=============================================================================

void to_json(nlohmann::json& j, const RemoteVideo& v) {
    j = nlohmann::json{
        {"id", v.id},
        {"filename", v.source_locator},
        {"optimizing", v.is_optimizing},
        {"title", v.title},
    };
    j["size"] = v.size_bytes ? nlohmann::json(*v.size_bytes) : nlohmann::json(nullptr);
}

// Accepts both the engine's own layout and raw catalog rows, where the
// optimizing state is carried by the server processing "status".
void from_json(const nlohmann::json& j, RemoteVideo& v) {
    j.at("id").get_to(v.id);
    j.at("filename").get_to(v.source_locator);

    v.size_bytes.reset();
    if (j.contains("size") && j["size"].is_number()) {
        auto size = j["size"].get<std::int64_t>();
        if (size > 0) v.size_bytes = static_cast<std::uint64_t>(size);
    }

    if (j.contains("optimizing") && j["optimizing"].is_boolean()) {
        v.is_optimizing = j["optimizing"].get<bool>();
    } else if (j.contains("status") && j["status"].is_string()) {
        v.is_optimizing = j["status"].get<std::string>() != PROCESSED_STATUS;
    } else {
        v.is_optimizing = false;
    }

    v.title = (j.contains("title") && j["title"].is_string()) ? j["title"].get<std::string>() : std::string{};
}

void to_json(nlohmann::json& j, const TrackedDownload& d) {
    j = nlohmann::json{
        {"video", d.video},
        {"status", to_string(d.status)},
        {"downloadedBytes", d.downloaded_bytes},
        {"totalBytes", d.total_bytes},
        {"lastLocator", d.source_locator_snapshot},
        {"outputPath", d.output_path},
    };
    j["errorMessage"] = d.error_message ? nlohmann::json(*d.error_message) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, TrackedDownload& d) {
    j.at("video").get_to(d.video);

    auto status = status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown download status");
    }
    d.status = *status;

    j.at("downloadedBytes").get_to(d.downloaded_bytes);
    j.at("totalBytes").get_to(d.total_bytes);
    d.source_locator_snapshot = j.value("lastLocator", d.video.source_locator);
    d.output_path = j.value("outputPath", std::string{});

    d.error_message.reset();
    if (j.contains("errorMessage") && j["errorMessage"].is_string()) {
        d.error_message = j["errorMessage"].get<std::string>();
    }
}

} // namespace reel::core
