// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace reel::core {

// Serial executor: one thread runs posted tasks in order, plus a timer queue.
// Everything posted to one Strand is mutually exclusive.
class Strand {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    Strand();
    ~Strand();

    Strand(const Strand&) = delete;
    Strand& operator=(const Strand&) = delete;

    // Queue a task; returns false (and drops it) after shutdown
    bool post(Task task);

    // Queue a task to run once delay has elapsed
    bool post_after(std::chrono::milliseconds delay, Task task);

    // Wait until every task queued before this call has run.
    // Returns immediately when called from the strand itself or after shutdown.
    void drain();

    // Stop the thread; queued tasks and timers are dropped
    void shutdown() noexcept;

    [[nodiscard]] bool running_in_this_thread() const noexcept {
        return std::this_thread::get_id() == thread_id_;
    }

private:
    struct Timer {
        Clock::time_point due;
        std::uint64_t seq{0};
        Task task;
    };

    struct TimerLater {
        bool operator()(const Timer& a, const Timer& b) const noexcept {
            return a.due != b.due ? a.due > b.due : a.seq > b.seq;
        }
    };

    void run(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> queue_;
    std::vector<Timer> timers_;   // Min-heap on due time
    std::uint64_t next_seq_{0};
    bool stopped_{false};
    std::thread::id thread_id_;
    std::jthread thread_;
};

} // namespace reel::core
