// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

struct Bookmark {
    double position{0.0};        // Playback position in seconds
    double updated_at{0.0};      // Unix time of the last update

    bool operator==(const Bookmark&) const = default;
};

// Playback position per video id, persisted as one JSON file
class BookmarkStore {
public:
    explicit BookmarkStore(std::string path);

    [[nodiscard]] std::error_code open() noexcept;

    [[nodiscard]] std::optional<Bookmark> get(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const;
    [[nodiscard]] std::error_code set(std::string_view id, Bookmark bookmark) noexcept;
    [[nodiscard]] std::error_code remove(std::string_view id) noexcept;
    [[nodiscard]] std::error_code clear() noexcept;

private:
    [[nodiscard]] std::error_code persist() const noexcept;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, Bookmark, std::less<>> bookmarks_;
};

} // namespace reel::core
