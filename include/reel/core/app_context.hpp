// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/bookmark_store.hpp>
#include <reel/core/catalog.hpp>
#include <reel/core/catalog_reconciler.hpp>
#include <reel/core/config.hpp>
#include <reel/core/download_coordinator.hpp>
#include <reel/core/events.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/optimizing_watcher.hpp>
#include <reel/core/segment_store.hpp>
#include <reel/core/tracking_store.hpp>
#include <expected>
#include <memory>
#include <string>
#include <system_error>

namespace reel::core {

// Owns every engine component for the lifetime of the process. Built once
// in main and passed by reference to whatever needs it.
class AppContext {
public:
    // Null transport/catalog select the libcurl HttpSession and HttpCatalogClient
    [[nodiscard]] static std::expected<std::unique_ptr<AppContext>, std::error_code>
    create(EngineConfig config,
           std::unique_ptr<Transport> transport = nullptr,
           std::unique_ptr<CatalogClient> catalog = nullptr);

    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] EventBus& events() noexcept { return events_; }
    [[nodiscard]] DownloadCoordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] CatalogReconciler& reconciler() noexcept { return *reconciler_; }
    [[nodiscard]] BookmarkStore& bookmarks() noexcept { return bookmarks_; }
    [[nodiscard]] CatalogCache& catalog_cache() noexcept { return cache_; }
    [[nodiscard]] OptimizingWatcher& watcher() noexcept { return *watcher_; }

    // Sync with the catalog for code, and keep polling while anything is optimizing
    ReconcileReport sync(std::string_view code);

    // Logout: stop everything and delete all local state
    void wipe();

private:
    AppContext(EngineConfig config,
               std::unique_ptr<Transport> transport,
               std::unique_ptr<CatalogClient> catalog);

    EngineConfig config_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<CatalogClient> catalog_;
    EventBus events_;
    TrackingStore tracking_;
    SegmentStore segments_;
    BookmarkStore bookmarks_;
    CatalogCache cache_;
    std::unique_ptr<DownloadCoordinator> coordinator_;
    std::unique_ptr<CatalogReconciler> reconciler_;
    std::unique_ptr<OptimizingWatcher> watcher_;
};

} // namespace reel::core
