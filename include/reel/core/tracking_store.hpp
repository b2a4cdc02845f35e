// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/models.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::core {

// Durable id -> TrackedDownload mapping backed by one JSON file.
// Every mutation rewrites the file before returning. Not thread-safe: the
// download coordinator is its only writer.
class TrackingStore {
public:
    explicit TrackingStore(std::string path);

    // Read the file; a missing file is an empty store
    [[nodiscard]] std::error_code open() noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] std::optional<TrackedDownload> get(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const noexcept;
    [[nodiscard]] std::vector<TrackedDownload> all() const;
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

    // Insert or replace, then persist
    [[nodiscard]] std::error_code put(const TrackedDownload& record) noexcept;

    // Erase, then persist. Erasing an unknown id is not an error.
    [[nodiscard]] std::error_code erase(std::string_view id) noexcept;

    // Drop everything and delete the file
    [[nodiscard]] std::error_code clear() noexcept;

private:
    [[nodiscard]] std::error_code persist() const noexcept;

    std::string path_;
    std::map<std::string, TrackedDownload, std::less<>> records_;
};

} // namespace reel::core
