// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
};

// Receives body bytes as they arrive. A non-empty error aborts the transfer
// and is returned from the request.
using BodySink = std::function<std::error_code(const char* data, std::size_t size)>;

// Range-capable transfer used by the engine. Implementations must be safe to
// call from several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // HEAD request for the content length
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET bytes [first, last] (inclusive), or [first, end) when last is empty.
    // A server that ignores the Range header for first > 0 fails with invalid_range.
    [[nodiscard]] virtual std::error_code
    get_range(const std::string& url,
              std::uint64_t first,
              std::optional<std::uint64_t> last,
              const BodySink& sink,
              std::stop_token stop) noexcept = 0;

    // GET a small document into memory
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    get_body(const std::string& url) noexcept = 0;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{30};
    std::uint32_t stall_timeout_sec{30};
    std::string user_agent{"reel"};
};

// libcurl transport; one easy handle per request
class HttpSession final : public Transport {
public:
    explicit HttpSession(HttpOptions options = {});
    ~HttpSession() override = default;

    // Non-copyable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::error_code
    get_range(const std::string& url,
              std::uint64_t first,
              std::optional<std::uint64_t> last,
              const BodySink& sink,
              std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<std::string, std::error_code>
    get_body(const std::string& url) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status code to an engine error; empty for 2xx/3xx
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

private:
    HttpOptions options_;
};

} // namespace reel::core
