// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <reel/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::optional<std::uint64_t> parse_length(const std::map<std::string, std::string>& headers) {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) return std::nullopt;

    char* end = nullptr;
    unsigned long long val = std::strtoull(it->second.c_str(), &end, 10);
    if (end != it->second.c_str() + it->second.size()) return std::nullopt;
    return static_cast<std::uint64_t>(val);
}

// State shared with the range write callback
struct RangeTransfer {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    std::stop_token stop;
    bool ranged{false};
    bool checked_status{false};
    std::error_code error;
};

std::size_t range_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* t = static_cast<RangeTransfer*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!t->checked_status) {
        t->checked_status = true;
        long http_code = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = HttpSession::status_error(http_code); ec) {
            t->error = ec;
            return 0;
        }
        // 200 to a ranged request means the body starts at byte 0
        if (t->ranged && http_code != 206) {
            t->error = make_error_code(DownloadErrc::invalid_range);
            return 0;
        }
    }

    if (t->stop.stop_requested()) {
        t->error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    try {
        if (auto ec = (*t->sink)(ptr, bytes); ec) {
            t->error = ec;
            return 0;
        }
    } catch (const std::exception&) {
        t->error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return bytes;
}

// libcurl progress callback - aborts once a stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* t = static_cast<RangeTransfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

std::size_t string_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t bytes = size * nmemb;
    try {
        body->append(ptr, bytes);
    } catch (const std::exception&) {
        return 0;
    }
    return bytes;
}

std::error_code curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:    return make_error_code(DownloadErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:  return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:           return make_error_code(DownloadErrc::invalid_range);
        case CURLE_ABORTED_BY_CALLBACK:   return make_error_code(DownloadErrc::cancelled);
        default:                          return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url, const HttpOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.stall_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {
}

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 404 || http_code == 410) return make_error_code(DownloadErrc::not_found);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::network_error);
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url, options_);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {}: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = status_error(http_code); ec) {
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
    response.content_length = parse_length(response.headers);

    return response;
}

std::error_code HttpSession::get_range(const std::string& url,
                                       std::uint64_t first,
                                       std::optional<std::uint64_t> last,
                                       const BodySink& sink,
                                       std::stop_token stop) noexcept {
    if (last && *last < first) {
        return make_error_code(DownloadErrc::invalid_range);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    RangeTransfer transfer;
    transfer.curl = curl.ptr;
    transfer.sink = &sink;
    transfer.stop = std::move(stop);
    transfer.ranged = first > 0 || last.has_value();

    apply_common_options(curl.ptr, url, options_);

    std::string range;
    if (transfer.ranged) {
        range = std::to_string(first) + "-" + (last ? std::to_string(*last) : std::string{});
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, range_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);

    // Errors raised from our own callbacks take precedence over curl's code
    if (transfer.error) {
        return transfer.error;
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} [{}]: {}", url, range, curl_easy_strerror(result));
        return curl_error(result);
    }

    // Empty bodies never reach the write callback
    if (!transfer.checked_status) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = status_error(http_code); ec) {
            return ec;
        }
    }
    return {};
}

std::expected<std::string, std::error_code>
HttpSession::get_body(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::string body;
    apply_common_options(curl.ptr, url, options_);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, string_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("GET {}: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = status_error(http_code); ec) {
        return std::unexpected(ec);
    }
    return body;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace reel::core
