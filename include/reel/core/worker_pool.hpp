// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace reel::core {

// Fixed set of threads for blocking network and disk work
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::uint32_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a job; ignored after shutdown
    void submit(Job job);

    // Stop accepting jobs, drop queued ones and join running ones.
    // Running jobs are expected to observe their own stop tokens.
    void shutdown() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    void run(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    bool stopped_{false};
    std::vector<std::jthread> threads_;
};

} // namespace reel::core
