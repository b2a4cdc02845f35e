// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/http_session.hpp>
#include <reel/core/models.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::core {

// Remote catalog for an access code. Results are all-or-nothing.
class CatalogClient {
public:
    virtual ~CatalogClient() = default;

    [[nodiscard]] virtual std::expected<std::vector<RemoteVideo>, std::error_code>
    fetch_catalog(std::string_view code) = 0;
};

// GETs a JSON array of videos from a URL template where "{code}" is
// replaced with the percent-encoded access code
class HttpCatalogClient final : public CatalogClient {
public:
    HttpCatalogClient(Transport& transport, std::string url_template);

    [[nodiscard]] std::expected<std::vector<RemoteVideo>, std::error_code>
    fetch_catalog(std::string_view code) override;

    [[nodiscard]] std::string catalog_url(std::string_view code) const;

private:
    Transport& transport_;
    std::string url_template_;
};

// Parse a catalog document; fails on the first malformed entry
[[nodiscard]] std::expected<std::vector<RemoteVideo>, std::error_code>
parse_catalog(std::string_view body) noexcept;

// Last successfully fetched catalog, for offline use
class CatalogCache {
public:
    explicit CatalogCache(std::string path);

    [[nodiscard]] std::optional<std::vector<RemoteVideo>> load() const noexcept;
    [[nodiscard]] std::error_code save(const std::vector<RemoteVideo>& videos) const noexcept;
    [[nodiscard]] std::error_code clear() const noexcept;

private:
    std::string path_;
};

} // namespace reel::core
