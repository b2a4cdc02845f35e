// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/app_context.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace reel::core {

namespace fs = std::filesystem;

namespace {

std::string data_file(const EngineConfig& config, std::string_view name) {
    return (fs::path(config.data_dir) / name).string();
}

} // namespace

AppContext::AppContext(EngineConfig config,
                       std::unique_ptr<Transport> transport,
                       std::unique_ptr<CatalogClient> catalog)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , catalog_(std::move(catalog))
    , tracking_(data_file(config_, "downloads.json"))
    , segments_(data_file(config_, "segments"))
    , bookmarks_(data_file(config_, "bookmarks.json"))
    , cache_(data_file(config_, "catalog_cache.json")) {
    if (!transport_) {
        HttpOptions options;
        options.connect_timeout_sec = config_.connect_timeout_sec;
        options.stall_timeout_sec = config_.stall_timeout_sec;
        transport_ = std::make_unique<HttpSession>(std::move(options));
    }
    if (!catalog_) {
        catalog_ = std::make_unique<HttpCatalogClient>(*transport_, config_.catalog_url);
    }
}

AppContext::~AppContext() {
    // Watcher calls into the reconciler, which calls into the coordinator
    watcher_.reset();
    reconciler_.reset();
    coordinator_.reset();
}

std::expected<std::unique_ptr<AppContext>, std::error_code>
AppContext::create(EngineConfig config,
                   std::unique_ptr<Transport> transport,
                   std::unique_ptr<CatalogClient> catalog) {
    for (const auto& dir : {config.data_dir, config.segment_path(), config.output_path()}) {
        if (auto ec = disk::ensure_directory(dir); ec) {
            spdlog::error("cannot create {}: {}", dir, ec.message());
            return std::unexpected(ec);
        }
    }

    std::unique_ptr<AppContext> ctx(new AppContext(std::move(config), std::move(transport), std::move(catalog)));

    if (auto ec = ctx->tracking_.open(); ec) {
        return std::unexpected(ec);
    }
    if (auto ec = ctx->bookmarks_.open(); ec) {
        return std::unexpected(ec);
    }

    ctx->coordinator_ = std::make_unique<DownloadCoordinator>(
        ctx->config_, *ctx->transport_, ctx->tracking_, ctx->segments_, ctx->events_);
    ctx->reconciler_ = std::make_unique<CatalogReconciler>(
        *ctx->coordinator_, *ctx->catalog_, ctx->cache_, ctx->bookmarks_, ctx->events_);
    ctx->watcher_ = std::make_unique<OptimizingWatcher>(*ctx->reconciler_, ctx->config_.poll_interval);

    spdlog::debug("engine ready, data in {}", ctx->config_.data_dir);
    return ctx;
}

ReconcileReport AppContext::sync(std::string_view code) {
    auto report = reconciler_->refresh(code);
    if (any_optimizing(report.videos) && !watcher_->running()) {
        watcher_->start(std::string(code));
    }
    return report;
}

void AppContext::wipe() {
    watcher_->stop();
    coordinator_->wipe();
    coordinator_->drain();

    if (auto ec = bookmarks_.clear(); ec) {
        spdlog::warn("could not delete bookmarks: {}", ec.message());
    }
    if (auto ec = cache_.clear(); ec) {
        spdlog::warn("could not delete catalog cache: {}", ec.message());
    }
}

} // namespace reel::core
