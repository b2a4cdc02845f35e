// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/catalog_reconciler.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace reel::core {

// Periodically refreshes the catalog while any video is still optimizing.
// Stops on its own once nothing is left optimizing, or on stop().
class OptimizingWatcher {
public:
    OptimizingWatcher(CatalogReconciler& reconciler, std::chrono::milliseconds interval);
    ~OptimizingWatcher();

    OptimizingWatcher(const OptimizingWatcher&) = delete;
    OptimizingWatcher& operator=(const OptimizingWatcher&) = delete;

    // Start polling for code; restarts if already running for another code
    void start(std::string code);

    // Request stop and wait for the thread
    void stop() noexcept;

    // Block until the watcher exits by itself or is stopped
    void wait() noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t polls() const noexcept { return polls_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token stop, std::string code);

    CatalogReconciler& reconciler_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint32_t> polls_{0};
    std::jthread thread_;
};

// True if any video in the list is still optimizing
[[nodiscard]] bool any_optimizing(const std::vector<RemoteVideo>& videos) noexcept;

} // namespace reel::core
