// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/events.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace reel::core {

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    std::erase_if(handlers_, [id](const auto& entry) { return entry.first == id; });
}

void EventBus::publish(const DownloadEvent& event) const {
    // Copy so handlers may subscribe or unsubscribe while being called
    std::vector<std::pair<SubscriptionId, Handler>> snapshot;
    {
        std::lock_guard lock(mutex_);
        snapshot = handlers_;
    }
    for (const auto& [id, handler] : snapshot) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            spdlog::error("event subscriber {} threw: {}", id, e.what());
        }
    }
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

} // namespace reel::core
