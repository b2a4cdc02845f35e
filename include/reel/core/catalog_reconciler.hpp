// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/bookmark_store.hpp>
#include <reel/core/catalog.hpp>
#include <reel/core/download_coordinator.hpp>
#include <reel/core/events.hpp>
#include <reel/core/models.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace reel::core {

// What one reconciliation did
struct ReconcileReport {
    std::vector<std::string> added;      // New ids now tracked
    std::vector<std::string> removed;    // Cleaned up after leaving the catalog
    std::vector<std::string> resumed;    // Restarted on a new locator
    std::vector<std::string> ready;      // Finished optimizing
    std::vector<std::string> updated;    // Metadata merged
    std::vector<RemoteVideo> videos;     // Catalog in effect (fresh, or cached when offline)
    bool offline{false};

    // True when nothing was changed
    [[nodiscard]] bool no_changes() const noexcept {
        return added.empty() && removed.empty() && resumed.empty() &&
               ready.empty() && updated.empty();
    }
};

// Keeps tracked downloads in line with the remote catalog. Changes are
// detected against tracked state, so reconciling the same lists twice has
// no further effect.
class CatalogReconciler {
public:
    CatalogReconciler(DownloadCoordinator& coordinator,
                      CatalogClient& client,
                      CatalogCache& cache,
                      BookmarkStore& bookmarks,
                      EventBus& events);

    // Diff previous against fresh and issue the coordinator calls
    ReconcileReport reconcile(const std::vector<RemoteVideo>& previous,
                              const std::vector<RemoteVideo>& fresh);

    // Fetch the catalog for code and reconcile against the cached list.
    // On failure download state is untouched and the cached list is returned.
    ReconcileReport refresh(std::string_view code);

    [[nodiscard]] bool offline() const noexcept;

private:
    void set_offline(bool offline);

    DownloadCoordinator& coordinator_;
    CatalogClient& client_;
    CatalogCache& cache_;
    BookmarkStore& bookmarks_;
    EventBus& events_;

    std::mutex reconcile_mutex_;    // One reconciliation at a time
    mutable std::mutex state_mutex_;
    bool offline_{false};
};

} // namespace reel::core
