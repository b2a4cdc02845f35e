// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/strand.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

namespace reel::core {

Strand::Strand() {
    thread_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
    thread_id_ = thread_.get_id();
}

Strand::~Strand() {
    shutdown();
}

bool Strand::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool Strand::post_after(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return false;
        timers_.push_back(Timer{Clock::now() + delay, next_seq_++, std::move(task)});
        std::push_heap(timers_.begin(), timers_.end(), TimerLater{});
    }
    cv_.notify_one();
    return true;
}

void Strand::drain() {
    if (running_in_this_thread()) return;

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        queue_.push_back([done] { done->set_value(); });
    }
    cv_.notify_one();
    future.wait();
}

void Strand::shutdown() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable() && !running_in_this_thread()) {
        thread_.join();
    }

    std::lock_guard lock(mutex_);
    queue_.clear();
    timers_.clear();
}

void Strand::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        // Move due timers onto the queue, in due order
        auto now = Clock::now();
        while (!timers_.empty() && timers_.front().due <= now) {
            std::pop_heap(timers_.begin(), timers_.end(), TimerLater{});
            queue_.push_back(std::move(timers_.back().task));
            timers_.pop_back();
        }

        if (queue_.empty()) {
            if (timers_.empty()) {
                cv_.wait(lock, stop, [this] { return !queue_.empty() || !timers_.empty(); });
            } else {
                auto due = timers_.front().due;
                cv_.wait_until(lock, stop, due, [this, due] {
                    return !queue_.empty() || timers_.front().due < due;
                });
            }
            continue;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("strand task threw: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace reel::core
