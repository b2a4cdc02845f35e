// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/catalog.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <reel/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>

namespace reel::core {

namespace {

constexpr std::string_view CODE_PLACEHOLDER = "{code}";

std::string encode_query_value(std::string_view value) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            out += ch;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

} // namespace

//=============================================================================
// HttpCatalogClient
//=============================================================================

HttpCatalogClient::HttpCatalogClient(Transport& transport, std::string url_template)
    : transport_(transport)
    , url_template_(std::move(url_template)) {
}

std::string HttpCatalogClient::catalog_url(std::string_view code) const {
    std::string url = url_template_;
    auto encoded = encode_query_value(code);
    for (auto pos = url.find(CODE_PLACEHOLDER); pos != std::string::npos;
         pos = url.find(CODE_PLACEHOLDER, pos + encoded.size())) {
        url.replace(pos, CODE_PLACEHOLDER.size(), encoded);
    }
    return url;
}

std::expected<std::vector<RemoteVideo>, std::error_code>
HttpCatalogClient::fetch_catalog(std::string_view code) {
    if (url_template_.empty()) {
        spdlog::error("no catalog_url configured");
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto url = catalog_url(code);
    auto body = transport_.get_body(url);
    if (!body) {
        spdlog::warn("catalog fetch failed: {}", body.error().message());
        return std::unexpected(make_error_code(DownloadErrc::catalog_unreachable));
    }
    return parse_catalog(*body);
}

std::expected<std::vector<RemoteVideo>, std::error_code>
parse_catalog(std::string_view body) noexcept {
    try {
        auto doc = nlohmann::json::parse(body);
        // Accept a bare array or {"videos": [...]}
        const auto& items = doc.is_object() ? doc.at("videos") : doc;
        if (!items.is_array()) {
            return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
        }

        std::vector<RemoteVideo> videos;
        videos.reserve(items.size());
        for (const auto& item : items) {
            videos.push_back(item.get<RemoteVideo>());
        }
        return videos;
    } catch (const std::exception& e) {
        spdlog::error("malformed catalog: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    }
}

//=============================================================================
// CatalogCache
//=============================================================================

CatalogCache::CatalogCache(std::string path)
    : path_(std::move(path)) {
}

std::optional<std::vector<RemoteVideo>> CatalogCache::load() const noexcept {
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) return std::nullopt;
        return nlohmann::json::parse(file).get<std::vector<RemoteVideo>>();
    } catch (const std::exception& e) {
        spdlog::warn("ignoring unreadable catalog cache {}: {}", path_, e.what());
        return std::nullopt;
    }
}

std::error_code CatalogCache::save(const std::vector<RemoteVideo>& videos) const noexcept {
    try {
        return disk::write_file_atomic(path_, nlohmann::json(videos).dump(2));
    } catch (const std::exception& e) {
        spdlog::error("could not serialize catalog cache: {}", e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code CatalogCache::clear() const noexcept {
    return disk::remove_file(path_);
}

} // namespace reel::core
