// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/worker_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace reel::core {

WorkerPool::WorkerPool(std::uint32_t threads) {
    threads = std::max<std::uint32_t>(threads, 1);
    threads_.reserve(threads);
    for (std::uint32_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token stop) { run(std::move(stop)); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        jobs_.clear();
    }
    for (auto& t : threads_) {
        t.request_stop();
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::run(std::stop_token stop) {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !jobs_.empty(); })) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("worker job threw: {}", e.what());
        }
    }
}

} // namespace reel::core
