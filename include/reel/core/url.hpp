// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace reel::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // Resolve a catalog locator against a base URL. Absolute locators are
    // parsed as-is; relative ones are appended as path components.
    static std::expected<Url, std::error_code> join(std::string_view base,
                                                    std::string_view locator) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;

    Url() = default;

private:
    [[nodiscard]] std::string origin() const;  // scheme://host[:port]

    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Percent-encode characters that are not allowed unescaped in a URL path
[[nodiscard]] std::string encode_path(std::string_view path);

} // namespace reel::core
