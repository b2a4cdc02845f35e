// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace reel::core {

namespace {

bool is_unreserved_path_char(unsigned char c) noexcept {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '-': case '.': case '_': case '~':
        case '/': case ':': case '@': case '!': case '$':
        case '&': case '\'': case '(': case ')': case '*':
        case '+': case ',': case ';': case '=': case '%':
            return true;
        default:
            return false;
    }
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    std::string lower_scheme;
    lower_scheme.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        lower_scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    url.scheme_ = std::move(lower_scheme);

    auto rest_start = scheme_end + 3;

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
        if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
            url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    return url;
}

std::expected<Url, std::error_code> Url::join(std::string_view base,
                                              std::string_view locator) noexcept {
    if (locator.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    if (locator.find("://") != std::string_view::npos) {
        return parse(locator);
    }

    auto parsed = parse(base);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    std::string path = parsed->path_;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    while (!locator.empty() && locator.front() == '/') {
        locator.remove_prefix(1);
    }
    path += '/';
    path += encode_path(locator);

    parsed->path_ = std::move(path);
    parsed->query_.clear();
    parsed->fragment_.clear();
    return parsed;
}

std::string Url::full() const {
    std::string result = origin();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::origin() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string encode_path(std::string_view path) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (char ch : path) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved_path_char(c)) {
            out += ch;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

} // namespace reel::core
