// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/catalog_reconciler.hpp>
#include <spdlog/spdlog.h>
#include <map>
#include <set>

namespace reel::core {

CatalogReconciler::CatalogReconciler(DownloadCoordinator& coordinator,
                                     CatalogClient& client,
                                     CatalogCache& cache,
                                     BookmarkStore& bookmarks,
                                     EventBus& events)
    : coordinator_(coordinator)
    , client_(client)
    , cache_(cache)
    , bookmarks_(bookmarks)
    , events_(events) {
}

ReconcileReport CatalogReconciler::reconcile(const std::vector<RemoteVideo>& previous,
                                             const std::vector<RemoteVideo>& fresh) {
    std::lock_guard lock(reconcile_mutex_);
    ReconcileReport report;
    report.videos = fresh;

    std::map<std::string, TrackedDownload> tracked;
    for (auto& record : coordinator_.list_tracked_downloads()) {
        auto id = record.id();
        tracked.emplace(std::move(id), std::move(record));
    }

    std::set<std::string> fresh_ids;
    for (const auto& video : fresh) {
        fresh_ids.insert(video.id);
    }

    // (a) Gone from the catalog
    for (const auto& video : previous) {
        if (fresh_ids.contains(video.id)) continue;
        bool has_record = tracked.contains(video.id);
        bool has_bookmark = bookmarks_.contains(video.id);
        if (!has_record && !has_bookmark) continue;

        spdlog::info("[{}] removed from catalog, cleaning up", video.id);
        if (has_record) {
            coordinator_.forget(video.id);
        }
        if (auto ec = bookmarks_.remove(video.id); ec) {
            spdlog::warn("[{}] could not delete bookmark: {}", video.id, ec.message());
        }
        report.removed.push_back(video.id);
    }

    for (const auto& video : fresh) {
        auto it = tracked.find(video.id);

        // (c) New
        if (it == tracked.end()) {
            coordinator_.track(video);
            report.added.push_back(video.id);
            continue;
        }

        // (b) Present in both
        const auto& record = it->second;

        if (record.video.is_optimizing && !video.is_optimizing) {
            spdlog::info("[{}] finished optimizing", video.id);
            events_.publish(VideoReadyEvent{video.id, video.title});
            report.ready.push_back(video.id);
        }

        if (record.video != video) {
            coordinator_.track(video);
            report.updated.push_back(video.id);
        }

        bool resumable = record.status == DownloadStatus::downloading ||
                         record.status == DownloadStatus::error;
        if (resumable && !video.is_optimizing &&
            record.source_locator_snapshot != video.source_locator) {
            spdlog::info("[{}] locator changed from {} to {}, resuming", video.id,
                         record.source_locator_snapshot, video.source_locator);
            coordinator_.resume_if_active(video.id, video.source_locator);
            report.resumed.push_back(video.id);
        }
    }

    // Later reads observe everything issued above
    coordinator_.drain();

    if (!report.no_changes()) {
        spdlog::info("reconciled catalog: {} added, {} removed, {} resumed, {} ready",
                     report.added.size(), report.removed.size(), report.resumed.size(),
                     report.ready.size());
    }
    return report;
}

ReconcileReport CatalogReconciler::refresh(std::string_view code) {
    auto previous = cache_.load().value_or(std::vector<RemoteVideo>{});

    auto fresh = client_.fetch_catalog(code);
    if (!fresh) {
        spdlog::warn("catalog unreachable ({}), using {} cached videos", fresh.error().message(),
                     previous.size());
        set_offline(true);

        ReconcileReport report;
        report.videos = std::move(previous);
        report.offline = true;
        return report;
    }

    if (auto ec = cache_.save(*fresh); ec) {
        spdlog::warn("could not update catalog cache: {}", ec.message());
    }
    set_offline(false);
    return reconcile(previous, *fresh);
}

bool CatalogReconciler::offline() const noexcept {
    std::lock_guard lock(state_mutex_);
    return offline_;
}

void CatalogReconciler::set_offline(bool offline) {
    {
        std::lock_guard lock(state_mutex_);
        if (offline_ == offline) return;
        offline_ = offline;
    }
    events_.publish(OfflineStateChangedEvent{offline});
}

} // namespace reel::core
