// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace reel::core {

struct ProgressEvent {
    std::string video_id;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};

    [[nodiscard]] double fraction() const noexcept {
        if (total_bytes == 0) return 0.0;
        return downloaded_bytes >= total_bytes
            ? 1.0
            : static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    }
};

struct CompletedEvent {
    std::string video_id;
    std::string output_path;
};

struct FailedEvent {
    std::string video_id;
    std::error_code error;
    std::string message;
};

// Server finished optimizing a tracked video
struct VideoReadyEvent {
    std::string video_id;
    std::string title;
};

struct OfflineStateChangedEvent {
    bool offline{false};
};

using DownloadEvent = std::variant<ProgressEvent,
                                   CompletedEvent,
                                   FailedEvent,
                                   VideoReadyEvent,
                                   OfflineStateChangedEvent>;

// Single typed channel between the engine and its consumers.
// Handlers run on the publishing thread and must not block.
class EventBus {
public:
    using Handler = std::function<void(const DownloadEvent&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    void publish(const DownloadEvent& event) const;

    [[nodiscard]] std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    SubscriptionId next_id_{1};
};

} // namespace reel::core
