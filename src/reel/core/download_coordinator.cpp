// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/download_coordinator.hpp>
#include <reel/core/url.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/disk/merge.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace reel::core {

namespace fs = std::filesystem;

//=============================================================================
// Public entry points (post onto the strand)
//=============================================================================

DownloadCoordinator::DownloadCoordinator(EngineConfig config,
                                         Transport& transport,
                                         TrackingStore& tracking,
                                         SegmentStore& segments,
                                         EventBus& events)
    : config_(std::move(config))
    , transport_(transport)
    , tracking_(tracking)
    , segments_(segments)
    , events_(events)
    , fetcher_(transport, config_.progress_interval)
    , pool_(config_.max_active_videos * config_.max_concurrent_segments) {
}

DownloadCoordinator::~DownloadCoordinator() {
    // 1. Signal every in-flight job; records stay Downloading for restore
    (void)strand_.post([this] {
        shutting_down_ = true;
        queued_.clear();
        stop_all(false);
    });
    strand_.drain();

    // 2. Join workers, then apply the last results they posted
    pool_.shutdown();
    strand_.drain();
    strand_.shutdown();
}

void DownloadCoordinator::track(RemoteVideo video) {
    (void)strand_.post([this, video = std::move(video)] {
        auto record = tracking_.get(video.id);
        if (!record) {
            spdlog::info("[{}] tracking new video", video.id);
            if (auto ec = tracking_.put(TrackedDownload::from_remote(video)); ec) {
                spdlog::error("[{}] could not store record: {}", video.id, ec.message());
            }
            return;
        }

        if (record->video == video) return;

        record->video = video;
        if (record->total_bytes == 0 && video.size_bytes) {
            record->total_bytes = *video.size_bytes;
            if (record->downloaded_bytes > record->total_bytes) {
                record->downloaded_bytes = 0;
            }
        }
        if (auto ec = tracking_.put(*record); ec) {
            spdlog::error("[{}] could not store record: {}", video.id, ec.message());
        }
    });
}

void DownloadCoordinator::start(std::string id) {
    (void)strand_.post([this, id = std::move(id)] { do_start(id, std::nullopt); });
}

void DownloadCoordinator::resume(std::string id, std::string locator) {
    (void)strand_.post([this, id = std::move(id), locator = std::move(locator)] {
        do_start(id, locator);
    });
}

void DownloadCoordinator::resume_if_active(std::string id, std::string locator) {
    (void)strand_.post([this, id = std::move(id), locator = std::move(locator)] {
        // Status may have changed since the caller looked
        auto record = tracking_.get(id);
        if (!record) return;
        if (record->status != DownloadStatus::downloading &&
            record->status != DownloadStatus::error) {
            spdlog::debug("[{}] {}, not switching to {}", id, to_string(record->status), locator);
            return;
        }
        do_start(id, locator);
    });
}

void DownloadCoordinator::pause(std::string id) {
    (void)strand_.post([this, id = std::move(id)] {
        auto record = tracking_.get(id);
        if (!record) return;

        if (auto* task = find_task(id)) {
            stop_task(*task, false, false);
        }
        std::erase(queued_, id);

        if (record->status != DownloadStatus::downloading) return;

        // Re-read: stop_task may have persisted newer byte counts
        record = tracking_.get(id);
        record->status = DownloadStatus::paused;
        if (auto ec = tracking_.put(*record); ec) {
            spdlog::error("[{}] could not store record: {}", id, ec.message());
        }
        spdlog::info("[{}] paused at {}/{} bytes", id, record->downloaded_bytes, record->total_bytes);
        schedule_next();
    });
}

void DownloadCoordinator::cancel(std::string id) {
    (void)strand_.post([this, id = std::move(id)] {
        std::erase(queued_, id);
        if (auto* task = find_task(id)) {
            stop_task(*task, true, false);
        } else {
            discard_files(id);
        }

        if (auto record = tracking_.get(id)) {
            auto reset = TrackedDownload::from_remote(record->video);
            if (auto ec = tracking_.put(reset); ec) {
                spdlog::error("[{}] could not store record: {}", id, ec.message());
            }
        }
        spdlog::info("[{}] removed local download", id);
        schedule_next();
    });
}

void DownloadCoordinator::forget(std::string id) {
    (void)strand_.post([this, id = std::move(id)] {
        std::erase(queued_, id);
        if (auto* task = find_task(id)) {
            stop_task(*task, true, false);
        } else {
            discard_files(id);
        }

        if (auto ec = tracking_.erase(id); ec) {
            spdlog::error("[{}] could not delete record: {}", id, ec.message());
        }
        spdlog::info("[{}] no longer tracked", id);
        schedule_next();
    });
}

void DownloadCoordinator::restore_in_progress() {
    (void)strand_.post([this] {
        for (auto& record : tracking_.all()) {
            if (record.status == DownloadStatus::completed && !find_task(record.id())) {
                // Interrupted between completing and deleting segments
                if (segments_.load(record.id())) {
                    spdlog::info("[{}] deleting leftover segments of completed download", record.id());
                    if (auto ec = segments_.remove(record.id()); ec) {
                        spdlog::warn("[{}] could not delete segment plan: {}", record.id(), ec.message());
                    }
                    remove_segment_files(config_.segment_path(), record.id());
                }
                continue;
            }
            if (record.status != DownloadStatus::downloading) continue;
            if (find_task(record.id()) || is_queued(record.id())) continue;

            auto plan = segments_.load(record.id());
            bool partial = plan && (plan->has_partial_data() || plan->all_complete());

            if (partial && !record.video.is_optimizing) {
                spdlog::info("[{}] resuming interrupted download", record.id());
                do_start(record.id(), std::nullopt);
                continue;
            }

            // Stale download, no seamless resume
            spdlog::info("[{}] no partial data to resume, marking paused", record.id());
            record.status = DownloadStatus::paused;
            if (auto ec = tracking_.put(record); ec) {
                spdlog::error("[{}] could not store record: {}", record.id(), ec.message());
            }
        }
    });
}

void DownloadCoordinator::wipe() {
    (void)strand_.post([this] {
        spdlog::info("wiping all downloads");
        queued_.clear();
        stop_all(true);

        if (auto ec = tracking_.clear(); ec) {
            spdlog::warn("could not delete tracked records: {}", ec.message());
        }
        if (auto ec = segments_.clear(); ec) {
            spdlog::warn("could not delete segment records: {}", ec.message());
        }

        std::error_code ec;
        fs::remove_all(config_.segment_path(), ec);
        if (ec) spdlog::warn("could not delete {}: {}", config_.segment_path(), ec.message());
        fs::remove_all(config_.output_path(), ec);
        if (ec) spdlog::warn("could not delete {}: {}", config_.output_path(), ec.message());
    });
}

std::vector<TrackedDownload> DownloadCoordinator::list_tracked_downloads() {
    return query([this] { return tracking_.all(); });
}

std::optional<TrackedDownload> DownloadCoordinator::tracked(std::string id) {
    return query([this, &id] { return tracking_.get(id); });
}

bool DownloadCoordinator::is_active(std::string id) {
    return query([this, &id] { return find_task(id) != nullptr || is_queued(id); });
}

std::size_t DownloadCoordinator::active_count() {
    return query([this] { return tasks_.size() + queued_.size(); });
}

std::string DownloadCoordinator::output_file(std::string_view id) const {
    return (fs::path(config_.output_path()) / (disk::sanitize_file_name(id) + ".mp4")).string();
}

//=============================================================================
// State machine (strand only)
//=============================================================================

void DownloadCoordinator::do_start(const std::string& id, std::optional<std::string> locator) {
    auto record = tracking_.get(id);
    if (!record) {
        spdlog::warn("[{}] start requested for unknown video", id);
        events_.publish(FailedEvent{id, make_error_code(DownloadErrc::unknown_video),
                                    "Video is not tracked"});
        return;
    }

    if (record->video.is_optimizing) {
        spdlog::info("[{}] still optimizing, not starting", id);
        events_.publish(FailedEvent{id, make_error_code(DownloadErrc::video_optimizing),
                                    "Video is still being optimized"});
        return;
    }

    if (record->status == DownloadStatus::completed) {
        if (fs::exists(record->output_path)) {
            spdlog::debug("[{}] already downloaded", id);
            events_.publish(FailedEvent{id, make_error_code(DownloadErrc::already_completed),
                                        "Video already downloaded"});
            return;
        }
        spdlog::warn("[{}] output {} is missing, downloading again", id, record->output_path);
        record = TrackedDownload::from_remote(record->video);
    }

    if (locator && *locator != record->video.source_locator) {
        record->video.source_locator = *locator;
    }
    const std::string& target = record->video.source_locator;

    // A new size discards the planned segments, so progress restarts at zero
    if (record->video.size_bytes && record->total_bytes > 0 &&
        *record->video.size_bytes != record->total_bytes) {
        record->total_bytes = *record->video.size_bytes;
        record->downloaded_bytes = 0;
    }

    auto* task = find_task(id);
    if (task && task->phase != Phase::stopping && task->locator == target) {
        spdlog::debug("[{}] already downloading", id);
        return;
    }
    if (!task && is_queued(id)) {
        // Picks up the new locator when admitted
        record->source_locator_snapshot = target;
        if (auto ec = tracking_.put(*record); ec) {
            spdlog::error("[{}] could not store record: {}", id, ec.message());
        }
        return;
    }

    // Optimistic transition
    record->status = DownloadStatus::downloading;
    record->error_message.reset();
    record->source_locator_snapshot = target;
    if (auto ec = tracking_.put(*record); ec) {
        spdlog::error("[{}] could not store record: {}", id, ec.message());
    }
    events_.publish(ProgressEvent{id, record->downloaded_bytes, record->total_bytes});

    if (task) {
        // Active on another locator, or winding down: relaunch once drained
        if (task->phase != Phase::stopping) {
            spdlog::info("[{}] locator changed to {}, restarting", id, target);
        }
        stop_task(*task, task->discard_on_stop, true);
        return;
    }

    admit(id);
}

void DownloadCoordinator::admit(const std::string& id) {
    if (shutting_down_) return;
    if (tasks_.size() < config_.max_active_videos) {
        launch(id);
    } else {
        spdlog::info("[{}] waiting for a free download slot", id);
        queued_.push_back(id);
    }
}

void DownloadCoordinator::schedule_next() {
    while (!shutting_down_ && !queued_.empty() && tasks_.size() < config_.max_active_videos) {
        auto id = queued_.front();
        queued_.pop_front();

        auto record = tracking_.get(id);
        if (!record || record->status != DownloadStatus::downloading) continue;
        launch(id);
    }
}

void DownloadCoordinator::launch(const std::string& id) {
    auto record = tracking_.get(id);
    if (!record || shutting_down_) return;

    auto [it, inserted] = tasks_.try_emplace(id);
    Task& task = it->second;
    task.id = id;
    task.generation = next_generation_++;
    task.locator = record->video.source_locator;
    task.phase = Phase::probing;

    if (record->source_locator_snapshot != task.locator) {
        record->source_locator_snapshot = task.locator;
        if (auto ec = tracking_.put(*record); ec) {
            spdlog::error("[{}] could not store record: {}", id, ec.message());
        }
    }

    auto url = Url::join(config_.base_url, task.locator);
    if (!url) {
        fail(task, DownloadErrc::invalid_url, "Invalid locator: " + task.locator);
        return;
    }
    task.url = url->full();

    // Size known up front: catalog, or a stored plan for this very locator
    std::optional<std::uint64_t> size = record->video.size_bytes;
    if (!size) {
        auto stored = segments_.load(id);
        if (stored && stored->locator == task.locator && stored->total_size > 0) {
            size = stored->total_size;
        }
    }

    if (size) {
        begin_plan(task, size);
    } else {
        spdlog::debug("[{}] size unknown, probing", id);
        submit_head(task);
    }
}

void DownloadCoordinator::begin_plan(Task& task, std::optional<std::uint64_t> size) {
    const auto& id = task.id;

    std::optional<SegmentPlan> plan;
    auto stored = segments_.load(id);
    if (!stored && stored.error() != make_error_code(disk::DiskErrc::file_not_found)) {
        spdlog::warn("[{}] discarding unreadable segment plan: {}", id, stored.error().message());
        discard_files(id);
    } else if (stored) {
        bool same_size = size ? *size == stored->total_size
                              : stored->locator == task.locator;
        if (same_size && stored->chunk_size > 0) {
            if (stored->locator != task.locator) {
                spdlog::info("[{}] locator changed, size unchanged: keeping {} segments", id,
                             stored->segments.size());
                stored->locator = task.locator;
            }
            plan = std::move(*stored);
        } else {
            spdlog::warn("[{}] {}: planned {} bytes, remote has {}; restarting from zero", id,
                         make_error_code(DownloadErrc::size_mismatch).message(),
                         stored->total_size, size ? std::to_string(*size) : std::string("unknown"));
            discard_files(id);
        }
    }

    if (!plan) {
        if (!size) {
            spdlog::warn("[{}] {}: falling back to a single segment", id,
                         make_error_code(DownloadErrc::size_unknown).message());
        }
        auto fresh = SegmentPlan::create(id, task.locator, size.value_or(0), config_.chunk_size);
        if (!fresh) {
            fail(task, DownloadErrc::invalid_range, fresh.error().message());
            return;
        }
        plan = std::move(*fresh);
    }

    task.plan = std::move(*plan);
    sync_with_files(task.plan, config_.segment_path());
    task.phase = Phase::fetching;
    persist_progress(task, true);

    if (task.plan.all_complete()) {
        begin_merge(task);
        return;
    }

    for (const auto& seg : task.plan.segments) {
        if (!seg.complete) task.pending.push_back(seg.index);
    }
    spdlog::info("[{}] downloading {} of {} segments ({} bytes done)", id, task.pending.size(),
                 task.plan.segments.size(), task.plan.bytes_received());
    pump(task);
}

void DownloadCoordinator::pump(Task& task) {
    while (task.phase == Phase::fetching &&
           task.in_flight.size() < config_.max_concurrent_segments &&
           !task.pending.empty()) {
        auto index = task.pending.front();
        task.pending.pop_front();
        task.in_flight.insert(index);
        submit_fetch(task, index);
    }
}

void DownloadCoordinator::begin_merge(Task& task) {
    task.phase = Phase::merging;
    spdlog::info("[{}] all segments complete, merging", task.id);
    submit_merge(task);
}

void DownloadCoordinator::stop_task(Task& task, bool discard, bool restart) {
    task.stop.request_stop();
    task.pending.clear();
    task.discard_on_stop = discard;
    task.restart_after_stop = restart;

    if (task.phase != Phase::stopping) {
        task.phase = Phase::stopping;
        if (!discard && !task.plan.segments.empty()) {
            persist_progress(task, false);
        }
    }

    if (task.outstanding == 0) {
        finish_stop(task.id);
    }
}

void DownloadCoordinator::stop_all(bool discard) {
    std::vector<std::string> ids;
    for (const auto& [id, task] : tasks_) {
        ids.push_back(id);
    }
    // stop_task may erase the task
    for (const auto& id : ids) {
        if (auto* task = find_task(id)) {
            stop_task(*task, discard, false);
        }
    }
}

void DownloadCoordinator::finish_stop(const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return;

    bool restart = it->second.restart_after_stop;
    if (it->second.discard_on_stop) {
        discard_files(id);
    } else if (!it->second.plan.segments.empty()) {
        persist_progress(it->second, false);
    }
    tasks_.erase(it);

    auto record = tracking_.get(id);
    if (restart && record && record->status == DownloadStatus::downloading) {
        admit(id);
    }
    schedule_next();
}

void DownloadCoordinator::fail(Task& task, DownloadErrc errc, std::string message) {
    spdlog::error("[{}] download failed: {}", task.id, message);

    if (auto record = tracking_.get(task.id)) {
        record->status = DownloadStatus::error;
        record->error_message = message;
        if (!task.plan.segments.empty()) {
            record->downloaded_bytes = task.plan.bytes_received();
        }
        if (auto ec = tracking_.put(*record); ec) {
            spdlog::error("[{}] could not store record: {}", task.id, ec.message());
        }
    }
    events_.publish(FailedEvent{task.id, make_error_code(errc), std::move(message)});

    // Siblings wind down, their partial bytes are kept
    stop_task(task, false, false);
}

void DownloadCoordinator::discard_files(const std::string& id) {
    if (auto ec = segments_.remove(id); ec) {
        spdlog::warn("[{}] could not delete segment plan: {}", id, ec.message());
    }
    remove_segment_files(config_.segment_path(), id);

    auto output = output_file(id);
    if (auto ec = disk::remove_file(output); ec) {
        spdlog::warn("[{}] could not delete {}: {}", id, output, ec.message());
    }
    (void)disk::remove_file(output + ".merging");
}

void DownloadCoordinator::persist_progress(Task& task, bool publish) {
    if (auto ec = segments_.save(task.plan); ec) {
        spdlog::error("[{}] could not save segment plan: {}", task.id, ec.message());
    }

    auto record = tracking_.get(task.id);
    if (!record) return;

    record->downloaded_bytes = task.plan.bytes_received();
    if (task.plan.total_size > 0) {
        record->total_bytes = task.plan.total_size;
    } else if (record->total_bytes < record->downloaded_bytes) {
        record->total_bytes = 0;
    }
    if (auto ec = tracking_.put(*record); ec) {
        spdlog::error("[{}] could not store record: {}", task.id, ec.message());
    }

    if (publish && record->status == DownloadStatus::downloading) {
        events_.publish(ProgressEvent{task.id, record->downloaded_bytes, record->total_bytes});
    }
}

DownloadCoordinator::Task* DownloadCoordinator::find_task(const std::string& id) noexcept {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

bool DownloadCoordinator::is_queued(const std::string& id) const noexcept {
    return std::find(queued_.begin(), queued_.end(), id) != queued_.end();
}

DownloadCoordinator::Task* DownloadCoordinator::settle(const std::string& id, std::uint64_t generation) {
    auto* task = find_task(id);
    if (!task || task->generation != generation) return nullptr;
    if (task->outstanding > 0) --task->outstanding;
    return task;
}

//=============================================================================
// Results (strand only)
//=============================================================================

void DownloadCoordinator::on_head_done(const std::string& id, std::uint64_t generation,
                                       std::optional<std::uint64_t> size) {
    auto* task = settle(id, generation);
    if (!task) return;

    if (task->phase == Phase::stopping) {
        if (task->outstanding == 0) finish_stop(id);
        return;
    }
    begin_plan(*task, size);
}

void DownloadCoordinator::on_segment_progress(const std::string& id, std::uint64_t generation,
                                              std::uint32_t index, std::uint64_t received) {
    auto* task = find_task(id);
    if (!task || task->generation != generation || task->discard_on_stop) return;
    if (index >= task->plan.segments.size()) return;

    auto& seg = task->plan.segments[index];
    if (received <= seg.bytes_received) return;
    seg.bytes_received = received;

    persist_progress(*task, task->phase == Phase::fetching);
}

void DownloadCoordinator::on_segment_done(const std::string& id, std::uint64_t generation,
                                          std::uint32_t index,
                                          std::expected<std::uint64_t, std::error_code> result) {
    auto* task = settle(id, generation);
    if (!task) return;
    task->in_flight.erase(index);

    if (index < task->plan.segments.size() && !task->discard_on_stop) {
        auto& seg = task->plan.segments[index];
        if (result) {
            seg.bytes_received = *result;
            seg.complete = true;
            persist_progress(*task, task->phase == Phase::fetching);
        }
    }

    if (task->phase == Phase::stopping) {
        if (task->outstanding == 0) finish_stop(id);
        return;
    }

    if (result) {
        if (task->plan.all_complete()) {
            begin_merge(*task);
        } else {
            pump(*task);
        }
        return;
    }

    auto attempt = ++task->failures[index];
    if (attempt > config_.max_segment_retries) {
        fail(*task, DownloadErrc::segment_transfer_failed,
             "Segment " + std::to_string(index) + " failed after " +
             std::to_string(config_.max_segment_retries) + " retries: " + result.error().message());
        return;
    }

    auto delay = config_.backoff(attempt);
    spdlog::warn("[{}] segment {} failed ({}), retry {}/{} in {} ms", id, index,
                 result.error().message(), attempt, config_.max_segment_retries, delay.count());

    (void)strand_.post_after(delay, [this, id, generation, index] {
        on_retry_due(id, generation, index);
    });
}

void DownloadCoordinator::on_retry_due(const std::string& id, std::uint64_t generation,
                                       std::uint32_t index) {
    auto* task = find_task(id);
    if (!task || task->generation != generation || task->phase != Phase::fetching) return;

    // Resumes from the segment's recorded bytes
    task->pending.push_front(index);
    pump(*task);
}

void DownloadCoordinator::on_merge_done(const std::string& id, std::uint64_t generation,
                                        std::expected<std::uint64_t, std::error_code> result) {
    auto* task = settle(id, generation);
    if (!task) return;

    if (task->discard_on_stop) {
        if (task->outstanding == 0) finish_stop(id);
        return;
    }

    if (!result) {
        if (task->phase == Phase::stopping) {
            if (task->outstanding == 0) finish_stop(id);
            return;
        }
        fail(*task, DownloadErrc::merge_failed,
             make_error_code(DownloadErrc::merge_failed).message() + ": " + result.error().message());
        return;
    }

    auto record = tracking_.get(id);
    if (!record) {
        stop_task(*task, true, false);
        return;
    }

    record->status = DownloadStatus::completed;
    record->total_bytes = *result;
    record->downloaded_bytes = *result;
    record->error_message.reset();
    record->output_path = output_file(id);
    if (auto ec = tracking_.put(*record); ec) {
        spdlog::error("[{}] could not store record: {}", id, ec.message());
    }

    // Only once the record says Completed: the output is whole
    if (auto ec = segments_.remove(id); ec) {
        spdlog::warn("[{}] could not delete segment plan: {}", id, ec.message());
    }
    remove_segment_files(config_.segment_path(), id);
    spdlog::info("[{}] completed: {} ({} bytes)", id, record->output_path, *result);

    events_.publish(ProgressEvent{id, record->downloaded_bytes, record->total_bytes});
    events_.publish(CompletedEvent{id, record->output_path});

    tasks_.erase(id);
    schedule_next();
}

//=============================================================================
// Jobs (worker threads)
//=============================================================================

void DownloadCoordinator::submit_head(Task& task) {
    ++task.outstanding;
    pool_.submit([this, id = task.id, generation = task.generation, url = task.url,
                  stop = task.stop.get_token(), attempts = config_.head_attempts] {
        std::optional<std::uint64_t> size;
        for (std::uint32_t attempt = 1; attempt <= attempts && !stop.stop_requested(); ++attempt) {
            auto response = transport_.head(url);
            if (response && response->content_length && *response->content_length > 0) {
                size = response->content_length;
                break;
            }
            spdlog::debug("[{}] HEAD attempt {}/{}: {}", id, attempt, attempts,
                          response ? std::string("no content length") : response.error().message());
        }
        (void)strand_.post([this, id, generation, size] { on_head_done(id, generation, size); });
    });
}

void DownloadCoordinator::submit_fetch(Task& task, std::uint32_t index) {
    const auto& seg = task.plan.segments[index];
    SegmentJob job;
    job.video_id = task.id;
    job.index = index;
    job.range = seg.range;
    job.received = seg.bytes_received;
    job.url = task.url;
    job.file_path = segment_file_path(config_.segment_path(), task.id, index);

    ++task.outstanding;
    pool_.submit([this, job = std::move(job), generation = task.generation, stop = task.stop.get_token()] {
        auto on_progress = [this, &job, generation](std::uint64_t received) {
            (void)strand_.post([this, id = job.video_id, generation, index = job.index, received] {
                on_segment_progress(id, generation, index, received);
            });
        };

        auto result = fetcher_.fetch(job, stop, on_progress);
        (void)strand_.post([this, id = job.video_id, generation, index = job.index, result] {
            on_segment_done(id, generation, index, result);
        });
    });
}

void DownloadCoordinator::submit_merge(Task& task) {
    std::vector<std::string> parts;
    parts.reserve(task.plan.segments.size());
    for (const auto& seg : task.plan.segments) {
        parts.push_back(segment_file_path(config_.segment_path(), task.id, seg.index));
    }

    std::optional<std::uint64_t> expected_length;
    if (task.plan.total_size > 0) {
        expected_length = task.plan.total_size;
    }

    ++task.outstanding;
    pool_.submit([this, id = task.id, generation = task.generation, parts = std::move(parts),
                  output = output_file(task.id), expected_length] {
        auto result = disk::merge_files(parts, output, expected_length);
        (void)strand_.post([this, id, generation, result] { on_merge_done(id, generation, result); });
    });
}

} // namespace reel::core
