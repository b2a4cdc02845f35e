// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/catalog.hpp>
#include <reel/core/events.hpp>
#include <reel/core/http_session.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace reel::test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::string file(std::string_view name) const;

private:
    std::string path_;
};

// Deterministic payload of the given size
[[nodiscard]] std::string make_content(std::size_t size);

[[nodiscard]] std::string read_file(const std::string& path);
void write_file(const std::string& path, std::string_view contents);

// Poll pred until it holds or timeout expires
bool wait_until(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(10));

// In-memory Transport. Serves registered resources with range support and
// records every ranged request.
class FakeTransport final : public core::Transport {
public:
    struct Request {
        std::string url;
        std::uint64_t first{0};
        std::optional<std::uint64_t> last;
    };

    // Serve content at url; HEAD reports its length unless report_length is false
    void serve(const std::string& url, std::string content, bool report_length = true);

    // The next `times` range requests whose first byte lies in [start, end)
    // deliver `deliver` bytes, then fail with network_error
    void fail_range(const std::string& url, std::uint64_t start, std::uint64_t end,
                    int times, std::size_t deliver = 0);
    void clear_failures();

    // Every range request on url delivers at most `after` bytes, then blocks
    // until release() or a stop request
    void hold(const std::string& url, std::size_t after);
    void release();

    // Catalog documents for get_body; missing urls fail with network_error
    void set_body(const std::string& url, std::string body);

    [[nodiscard]] std::vector<Request> requests() const;
    [[nodiscard]] std::vector<Request> requests_for(const std::string& url) const;
    [[nodiscard]] int head_count() const;
    [[nodiscard]] int blocked() const;

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::error_code
    get_range(const std::string& url,
              std::uint64_t first,
              std::optional<std::uint64_t> last,
              const core::BodySink& sink,
              std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<std::string, std::error_code>
    get_body(const std::string& url) noexcept override;

private:
    struct Resource {
        std::string content;
        bool report_length{true};
    };

    struct Failure {
        std::string url;
        std::uint64_t start{0};
        std::uint64_t end{0};
        int times{0};
        std::size_t deliver{0};
    };

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, std::string> bodies_;
    std::vector<Failure> failures_;
    std::map<std::string, std::size_t> holds_;
    std::vector<Request> requests_;
    int head_count_{0};
    int blocked_{0};
};

// Scripted catalog client
class FakeCatalog final : public core::CatalogClient {
public:
    void set(std::vector<core::RemoteVideo> videos);
    void go_offline();

    [[nodiscard]] int calls() const;

    [[nodiscard]] std::expected<std::vector<core::RemoteVideo>, std::error_code>
    fetch_catalog(std::string_view code) override;

private:
    mutable std::mutex mutex_;
    std::optional<std::vector<core::RemoteVideo>> videos_;
    int calls_{0};
};

// Collects every event published on a bus
class EventRecorder {
public:
    explicit EventRecorder(core::EventBus& bus);
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    [[nodiscard]] std::vector<core::DownloadEvent> all() const;
    [[nodiscard]] std::vector<core::ProgressEvent> progress(const std::string& id) const;
    [[nodiscard]] std::vector<core::FailedEvent> failures(const std::string& id) const;
    [[nodiscard]] int completed(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    core::EventBus& bus_;
    core::EventBus::SubscriptionId id_;
    mutable std::mutex mutex_;
    std::vector<core::DownloadEvent> events_;
};

[[nodiscard]] core::RemoteVideo make_video(std::string id, std::string locator,
                                           std::optional<std::uint64_t> size,
                                           bool optimizing = false);

} // namespace reel::test
