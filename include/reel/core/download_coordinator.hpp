// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/core/events.hpp>
#include <reel/core/models.hpp>
#include <reel/core/segment.hpp>
#include <reel/core/segment_store.hpp>
#include <reel/core/strand.hpp>
#include <reel/core/tracking_store.hpp>
#include <reel/core/worker_pool.hpp>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace reel::core {

// Owns one download task per video id and drives planner, fetcher and stores
// through the download state machine:
//
//   NotStarted -> Downloading -> {Paused, Completed, Error}
//   Paused -> Downloading, Error -> Downloading, any -> NotStarted (remove)
//
// Every public call returns immediately; outcomes arrive on the EventBus.
// Mutable state lives on a private Strand, network and disk work on a
// WorkerPool. Stores are written before the matching event is published.
class DownloadCoordinator {
public:
    DownloadCoordinator(EngineConfig config,
                        Transport& transport,
                        TrackingStore& tracking,
                        SegmentStore& segments,
                        EventBus& events);
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Create or refresh the record for a catalog entry; progress is kept
    void track(RemoteVideo video);

    // Start or resume with the catalog locator. No-op while already active.
    void start(std::string id);

    // Start or resume with a new locator. An active task restarts on it,
    // keeping its segments when the size is unchanged.
    void resume(std::string id, std::string locator);

    // resume, but only while the record is still Downloading or Error when
    // the call reaches the coordinator. Catalog reconciliation goes through here.
    void resume_if_active(std::string id, std::string locator);

    // Stop fetching, keep segments and partial bytes
    void pause(std::string id);

    // Stop fetching, delete segments and output, reset to NotStarted
    void cancel(std::string id);
    void remove(std::string id) { cancel(std::move(id)); }

    // Like remove, and drop the tracked record itself
    void forget(std::string id);

    // Startup: records left Downloading resume when they have partial data,
    // otherwise they fall back to Paused
    void restore_in_progress();

    // Stop everything and delete every record, segment and output
    void wipe();

    // Snapshot of all tracked records
    [[nodiscard]] std::vector<TrackedDownload> list_tracked_downloads();
    [[nodiscard]] std::optional<TrackedDownload> tracked(std::string id);

    // True while a task exists or the id waits for an active slot.
    // active_count() counts both.
    [[nodiscard]] bool is_active(std::string id);
    [[nodiscard]] std::size_t active_count();

    // Wait until every call made so far has been applied
    void drain() { strand_.drain(); }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::string output_file(std::string_view id) const;

private:
    enum class Phase : std::uint8_t {
        probing,    // HEAD for the size
        fetching,
        merging,
        stopping    // Waiting for outstanding jobs after pause/remove/failure
    };

    // Runtime state of one video while it owns an active slot
    struct Task {
        std::string id;
        std::uint64_t generation{0};
        std::stop_source stop;
        Phase phase{Phase::probing};
        std::string locator;
        std::string url;                   // base_url joined with locator
        SegmentPlan plan;
        std::deque<std::uint32_t> pending;
        std::set<std::uint32_t> in_flight;
        std::map<std::uint32_t, std::uint32_t> failures;
        std::uint32_t outstanding{0};      // Jobs whose result has not come back
        bool discard_on_stop{false};
        bool restart_after_stop{false};
    };

    // Strand-side handlers
    void do_start(const std::string& id, std::optional<std::string> locator);
    void admit(const std::string& id);
    void launch(const std::string& id);
    void begin_plan(Task& task, std::optional<std::uint64_t> size);
    void pump(Task& task);
    void begin_merge(Task& task);
    void stop_task(Task& task, bool discard, bool restart);
    void stop_all(bool discard);
    void finish_stop(const std::string& id);
    void fail(Task& task, DownloadErrc errc, std::string message);
    void schedule_next();
    void discard_files(const std::string& id);
    void persist_progress(Task& task, bool publish);

    void on_head_done(const std::string& id, std::uint64_t generation, std::optional<std::uint64_t> size);
    void on_segment_progress(const std::string& id, std::uint64_t generation,
                             std::uint32_t index, std::uint64_t received);
    void on_segment_done(const std::string& id, std::uint64_t generation, std::uint32_t index,
                         std::expected<std::uint64_t, std::error_code> result);
    void on_retry_due(const std::string& id, std::uint64_t generation, std::uint32_t index);
    void on_merge_done(const std::string& id, std::uint64_t generation,
                       std::expected<std::uint64_t, std::error_code> result);

    // Job bookkeeping shared by every result handler; returns the task when
    // the result belongs to its current generation
    Task* settle(const std::string& id, std::uint64_t generation);

    // Worker-side jobs
    void submit_head(Task& task);
    void submit_fetch(Task& task, std::uint32_t index);
    void submit_merge(Task& task);

    [[nodiscard]] Task* find_task(const std::string& id) noexcept;
    [[nodiscard]] bool is_queued(const std::string& id) const noexcept;

    // Run fn on the strand and wait for its result
    template <typename F>
    auto query(F fn) -> decltype(fn()) {
        if (strand_.running_in_this_thread()) return fn();
        std::promise<decltype(fn())> promise;
        auto future = promise.get_future();
        bool queued = strand_.post([&] {
            try {
                promise.set_value(fn());
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
        });
        if (!queued) return fn();
        return future.get();
    }

    EngineConfig config_;
    Transport& transport_;
    TrackingStore& tracking_;
    SegmentStore& segments_;
    EventBus& events_;
    SegmentFetcher fetcher_;

    std::map<std::string, Task> tasks_;
    std::deque<std::string> queued_;
    std::uint64_t next_generation_{1};
    bool shutting_down_{false};

    // Declared last: destroyed first
    Strand strand_;
    WorkerPool pool_;
};

} // namespace reel::core
