// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reel::core {

// Local download status of a tracked video
enum class DownloadStatus : std::uint8_t {
    not_started,
    downloading,
    paused,
    completed,
    error
};

[[nodiscard]] std::string_view to_string(DownloadStatus status) noexcept;
[[nodiscard]] std::optional<DownloadStatus> status_from_string(std::string_view s) noexcept;

// Server-authoritative catalog entry
struct RemoteVideo {
    std::string id;
    std::string source_locator;              // Filename/path used to build the fetch URL
    std::optional<std::uint64_t> size_bytes;
    bool is_optimizing{false};               // Playable encode not ready yet
    std::string title;

    bool operator==(const RemoteVideo&) const = default;
};

// Client-owned download record for one video
struct TrackedDownload {
    RemoteVideo video;
    DownloadStatus status{DownloadStatus::not_started};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};            // 0 while unknown
    std::optional<std::string> error_message;
    std::string source_locator_snapshot;     // Locator of the last attempted fetch
    std::string output_path;                 // Merged file, set once completed

    [[nodiscard]] const std::string& id() const noexcept { return video.id; }

    // Fraction in [0, 1]; 0 while the total is unknown
    [[nodiscard]] double fraction() const noexcept;

    // True when byte counts, status and error message are consistent
    [[nodiscard]] bool valid() const noexcept;

    [[nodiscard]] static TrackedDownload from_remote(const RemoteVideo& video);

    bool operator==(const TrackedDownload&) const = default;
};

void to_json(nlohmann::json& j, const RemoteVideo& v);
void from_json(const nlohmann::json& j, RemoteVideo& v);
void to_json(nlohmann::json& j, const TrackedDownload& d);
void from_json(const nlohmann::json& j, TrackedDownload& d);

} // namespace reel::core
