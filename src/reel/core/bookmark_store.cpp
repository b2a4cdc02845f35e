// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/bookmark_store.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <reel/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace reel::core {

BookmarkStore::BookmarkStore(std::string path)
    : path_(std::move(path)) {
}

std::error_code BookmarkStore::open() noexcept {
    std::lock_guard lock(mutex_);
    bookmarks_.clear();
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) return {};

        auto doc = nlohmann::json::parse(file);
        for (const auto& [id, value] : doc.items()) {
            Bookmark b;
            value.at("position").get_to(b.position);
            b.updated_at = value.value("updatedAt", 0.0);
            bookmarks_.insert_or_assign(id, b);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("could not read {}: {}", path_, e.what());
        bookmarks_.clear();
        return make_error_code(DownloadErrc::corrupt_state);
    }
}

std::optional<Bookmark> BookmarkStore::get(std::string_view id) const {
    std::lock_guard lock(mutex_);
    auto it = bookmarks_.find(id);
    if (it == bookmarks_.end()) return std::nullopt;
    return it->second;
}

bool BookmarkStore::contains(std::string_view id) const {
    std::lock_guard lock(mutex_);
    return bookmarks_.find(id) != bookmarks_.end();
}

std::error_code BookmarkStore::set(std::string_view id, Bookmark bookmark) noexcept {
    std::lock_guard lock(mutex_);
    try {
        bookmarks_.insert_or_assign(std::string(id), bookmark);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
    return persist();
}

std::error_code BookmarkStore::remove(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = bookmarks_.find(id);
    if (it == bookmarks_.end()) return {};
    bookmarks_.erase(it);
    return persist();
}

std::error_code BookmarkStore::clear() noexcept {
    std::lock_guard lock(mutex_);
    bookmarks_.clear();
    return disk::remove_file(path_);
}

std::error_code BookmarkStore::persist() const noexcept {
    try {
        nlohmann::json doc = nlohmann::json::object();
        for (const auto& [id, b] : bookmarks_) {
            doc[id] = {{"position", b.position}, {"updatedAt", b.updated_at}};
        }
        return disk::write_file_atomic(path_, doc.dump(2));
    } catch (const std::exception& e) {
        spdlog::error("could not serialize bookmarks: {}", e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace reel::core
