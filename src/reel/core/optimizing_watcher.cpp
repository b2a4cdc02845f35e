// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/optimizing_watcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace reel::core {

bool any_optimizing(const std::vector<RemoteVideo>& videos) noexcept {
    return std::any_of(videos.begin(), videos.end(),
                       [](const RemoteVideo& v) { return v.is_optimizing; });
}

OptimizingWatcher::OptimizingWatcher(CatalogReconciler& reconciler, std::chrono::milliseconds interval)
    : reconciler_(reconciler)
    , interval_(interval) {
}

OptimizingWatcher::~OptimizingWatcher() {
    stop();
}

void OptimizingWatcher::start(std::string code) {
    stop();
    running_.store(true, std::memory_order_release);
    thread_ = std::jthread([this, code = std::move(code)](std::stop_token stop) {
        run(std::move(stop), code);
    });
}

void OptimizingWatcher::stop() noexcept {
    if (thread_.joinable()) {
        thread_.request_stop();
        cv_.notify_all();
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

void OptimizingWatcher::wait() noexcept {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void OptimizingWatcher::run(std::stop_token stop, std::string code) {
    spdlog::info("watching for optimized videos every {} ms", interval_.count());

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            // Returns early only when stop is requested
            if (cv_.wait_for(lock, stop, interval_, [] { return false; }) || stop.stop_requested()) {
                break;
            }
        }

        polls_.fetch_add(1, std::memory_order_relaxed);
        try {
            auto report = reconciler_.refresh(code);
            if (!report.offline && !any_optimizing(report.videos)) {
                spdlog::info("no videos left optimizing, watcher done");
                break;
            }
        } catch (const std::exception& e) {
            spdlog::error("optimizing watcher: {}", e.what());
        }
    }

    running_.store(false, std::memory_order_release);
}

} // namespace reel::core
