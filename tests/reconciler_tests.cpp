// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/core/app_context.hpp>
#include "test_support.hpp"
#include <filesystem>

using namespace reel::core;
using reel::test::EventRecorder;
using reel::test::FakeCatalog;
using reel::test::FakeTransport;
using reel::test::TempDir;
using reel::test::make_content;
using reel::test::make_video;
using reel::test::read_file;
using reel::test::wait_until;

namespace fs = std::filesystem;

namespace {

constexpr const char* BASE = "https://cdn.example.com/media/";
constexpr const char* CODE = "CLASS-42";
constexpr std::uint64_t MB = 1'000'000;

std::string url_of(std::string_view locator) {
    return std::string(BASE) + std::string(locator);
}

// Full engine over fakes. The fakes stay owned by the context.
struct App {
    TempDir dir;
    FakeTransport* transport{nullptr};
    FakeCatalog* catalog{nullptr};
    std::unique_ptr<AppContext> ctx;
    std::unique_ptr<EventRecorder> recorder;

    explicit App(std::uint32_t max_active_videos = 2) {
        EngineConfig config;
        config.max_active_videos = max_active_videos;
        config.base_url = BASE;
        config.data_dir = dir.path();
        config.chunk_size = MB;
        config.max_concurrent_segments = 3;
        config.retry_delay = std::chrono::milliseconds(1);
        config.max_retry_delay = std::chrono::milliseconds(5);
        config.progress_interval = std::chrono::milliseconds(0);

        auto t = std::make_unique<FakeTransport>();
        auto c = std::make_unique<FakeCatalog>();
        transport = t.get();
        catalog = c.get();

        auto created = AppContext::create(std::move(config), std::move(t), std::move(c));
        REQUIRE(created.has_value());
        ctx = std::move(*created);
        recorder = std::make_unique<EventRecorder>(ctx->events());
    }

    ~App() {
        transport->release();
        recorder.reset();
        ctx.reset();
    }

    DownloadCoordinator& coordinator() { return ctx->coordinator(); }

    std::string serve(std::string_view locator, std::size_t size) {
        auto content = make_content(size);
        transport->serve(url_of(locator), content);
        return content;
    }

    std::optional<TrackedDownload> record(const std::string& id) {
        return coordinator().tracked(id);
    }

    bool wait_status(const std::string& id, DownloadStatus status) {
        return wait_until([&] {
            auto r = record(id);
            return r && r->status == status && !coordinator().is_active(id);
        });
    }

    int count_ready(const std::string& id) const {
        int n = 0;
        for (const auto& e : recorder->all()) {
            if (auto* r = std::get_if<VideoReadyEvent>(&e); r && r->video_id == id) ++n;
        }
        return n;
    }

    std::vector<bool> offline_events() const {
        std::vector<bool> out;
        for (const auto& e : recorder->all()) {
            if (auto* o = std::get_if<OfflineStateChangedEvent>(&e)) out.push_back(o->offline);
        }
        return out;
    }
};

} // namespace

TEST_CASE("Videos leaving the catalog are cleaned up", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", MB);
    auto v2 = make_video("v2", "v2.mp4", MB);
    app.serve("v1.mp4", MB);
    app.serve("v2.mp4", MB);

    app.catalog->set({v1, v2});
    auto first = app.ctx->reconciler().refresh(CODE);
    CHECK_FALSE(first.offline);
    CHECK(first.added == std::vector<std::string>{"v1", "v2"});
    CHECK(app.coordinator().list_tracked_downloads().size() == 2);

    app.coordinator().start("v2");
    REQUIRE(app.wait_status("v2", DownloadStatus::completed));
    REQUIRE(!app.ctx->bookmarks().set("v2", Bookmark{12.0, 1.0}));
    const auto output = app.coordinator().output_file("v2");
    REQUIRE(fs::exists(output));

    app.catalog->set({v1});
    auto second = app.ctx->reconciler().refresh(CODE);
    CHECK(second.removed == std::vector<std::string>{"v2"});
    CHECK(second.added.empty());

    CHECK(!app.record("v2").has_value());
    CHECK(app.record("v1").has_value());
    CHECK_FALSE(app.ctx->bookmarks().contains("v2"));
    CHECK_FALSE(fs::exists(output));

    SECTION("Reconciling again changes nothing") {
        auto events_before = app.recorder->size();
        auto third = app.ctx->reconciler().refresh(CODE);
        CHECK(third.no_changes());
        CHECK(app.recorder->size() == events_before);
        CHECK(app.coordinator().list_tracked_downloads().size() == 1);
    }

    SECTION("A bookmark alone is still cleaned up") {
        auto v3 = make_video("v3", "v3.mp4", MB);
        REQUIRE(!app.ctx->bookmarks().set("v3", Bookmark{1.0, 1.0}));
        auto report = app.ctx->reconciler().reconcile({v1, v3}, {v1});
        CHECK(report.removed == std::vector<std::string>{"v3"});
        CHECK_FALSE(app.ctx->bookmarks().contains("v3"));
    }
}

TEST_CASE("Metadata changes are merged without touching progress", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", MB);
    app.serve("v1.mp4", MB);
    app.catalog->set({v1});
    (void)app.ctx->reconciler().refresh(CODE);

    app.coordinator().start("v1");
    REQUIRE(app.wait_status("v1", DownloadStatus::completed));

    auto renamed = v1;
    renamed.title = "Lecture 1 (revised)";
    app.catalog->set({renamed});
    auto report = app.ctx->reconciler().refresh(CODE);
    CHECK(report.updated == std::vector<std::string>{"v1"});
    CHECK(report.resumed.empty());

    auto record = app.record("v1");
    CHECK(record->video.title == "Lecture 1 (revised)");
    CHECK(record->status == DownloadStatus::completed);
    CHECK(record->downloaded_bytes == MB);
}

TEST_CASE("A new locator resumes an active download", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", 3 * MB);
    auto content = app.serve("v1.mp4", 3 * MB);
    app.transport->hold(url_of("v1.mp4"), 200'000);

    app.catalog->set({v1});
    (void)app.ctx->reconciler().refresh(CODE);
    app.coordinator().start("v1");
    REQUIRE(wait_until([&] {
        auto r = app.record("v1");
        return app.transport->blocked() == 3 && r && r->downloaded_bytes == 600'000;
    }));

    SECTION("Same size keeps the downloaded segments") {
        auto moved = v1;
        moved.source_locator = "v1_cdn2.mp4";
        app.transport->serve(url_of("v1_cdn2.mp4"), content);

        app.catalog->set({moved});
        auto report = app.ctx->reconciler().refresh(CODE);
        CHECK(report.resumed == std::vector<std::string>{"v1"});
        CHECK(report.updated == std::vector<std::string>{"v1"});

        REQUIRE(app.wait_status("v1", DownloadStatus::completed));
        auto requests = app.transport->requests_for(url_of("v1_cdn2.mp4"));
        REQUIRE(requests.size() == 3);
        for (const auto& r : requests) {
            CHECK(r.first % MB == 200'000);
        }
        CHECK(read_file(app.coordinator().output_file("v1")) == content);
        CHECK(app.record("v1")->source_locator_snapshot == "v1_cdn2.mp4");

        SECTION("and a second pass does not resume again") {
            auto again = app.ctx->reconciler().refresh(CODE);
            CHECK(again.no_changes());
        }
    }

    SECTION("A different size restarts from zero") {
        auto reencoded = v1;
        reencoded.source_locator = "v1_v2.mp4";
        reencoded.size_bytes = 2 * MB;
        auto new_content = app.serve("v1_v2.mp4", 2 * MB);

        const auto seen = app.recorder->progress("v1").size();
        app.catalog->set({reencoded});
        auto report = app.ctx->reconciler().refresh(CODE);
        CHECK(report.resumed == std::vector<std::string>{"v1"});

        REQUIRE(app.wait_status("v1", DownloadStatus::completed));

        // The restarted attempt counts up from zero against the new size
        auto progress = app.recorder->progress("v1");
        REQUIRE(progress.size() > seen);
        CHECK(progress[seen].downloaded_bytes == 0);
        CHECK(progress[seen].total_bytes == 2 * MB);
        for (std::size_t i = seen + 1; i < progress.size(); ++i) {
            CHECK(progress[i].downloaded_bytes >= progress[i - 1].downloaded_bytes);
        }
        auto requests = app.transport->requests_for(url_of("v1_v2.mp4"));
        REQUIRE(requests.size() == 2);
        for (const auto& r : requests) {
            CHECK(r.first % MB == 0);
        }
        auto record = app.record("v1");
        CHECK(record->total_bytes == 2 * MB);
        CHECK(read_file(record->output_path) == new_content);
    }
}

TEST_CASE("Paused downloads are not resumed by a locator change", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", 2 * MB);
    app.serve("v1.mp4", 2 * MB);
    app.transport->hold(url_of("v1.mp4"), 100'000);

    app.catalog->set({v1});
    (void)app.ctx->reconciler().refresh(CODE);
    app.coordinator().start("v1");
    REQUIRE(wait_until([&] { return app.transport->blocked() == 2; }));
    app.coordinator().pause("v1");
    REQUIRE(app.wait_status("v1", DownloadStatus::paused));

    auto moved = v1;
    moved.source_locator = "elsewhere.mp4";
    app.catalog->set({moved});
    auto report = app.ctx->reconciler().refresh(CODE);
    CHECK(report.resumed.empty());
    CHECK(report.updated == std::vector<std::string>{"v1"});
    CHECK(app.record("v1")->status == DownloadStatus::paused);
    CHECK(app.transport->requests_for(url_of("elsewhere.mp4")).empty());
}

TEST_CASE("A queued download takes a new locator once", "[reconciler]") {
    App app(1);
    auto v1 = make_video("v1", "v1.mp4", MB);
    auto v2 = make_video("v2", "v2.mp4", MB);
    app.serve("v1.mp4", MB);
    app.serve("v2.mp4", MB);
    app.transport->hold(url_of("v1.mp4"), 100'000);

    app.catalog->set({v1, v2});
    (void)app.ctx->reconciler().refresh(CODE);
    app.coordinator().start("v1");
    REQUIRE(wait_until([&] { return app.transport->blocked() == 1; }));
    app.coordinator().start("v2");
    REQUIRE(wait_until([&] {
        auto r = app.record("v2");
        return r && r->status == DownloadStatus::downloading;
    }));

    auto moved = v2;
    moved.source_locator = "v2b.mp4";
    auto content = app.serve("v2b.mp4", MB);
    app.catalog->set({v1, moved});

    auto first = app.ctx->reconciler().refresh(CODE);
    CHECK(first.resumed == std::vector<std::string>{"v2"});
    CHECK(app.record("v2")->source_locator_snapshot == "v2b.mp4");

    auto second = app.ctx->reconciler().refresh(CODE);
    CHECK(second.no_changes());
    CHECK(second.resumed.empty());

    app.transport->release();
    REQUIRE(app.wait_status("v1", DownloadStatus::completed));
    REQUIRE(app.wait_status("v2", DownloadStatus::completed));
    CHECK(app.transport->requests_for(url_of("v2.mp4")).empty());
    CHECK(read_file(app.coordinator().output_file("v2")) == content);
}

TEST_CASE("A locator switch only applies to downloads still in progress", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", 2 * MB);
    auto v2 = make_video("v2", "v2.mp4", MB);
    app.serve("v1.mp4", 2 * MB);
    app.serve("elsewhere.mp4", 2 * MB);
    app.transport->hold(url_of("v1.mp4"), 100'000);

    app.catalog->set({v1, v2});
    (void)app.ctx->reconciler().refresh(CODE);

    SECTION("Paused after the caller looked") {
        app.coordinator().start("v1");
        REQUIRE(wait_until([&] {
            auto r = app.record("v1");
            return app.transport->blocked() == 2 && r && r->downloaded_bytes == 200'000;
        }));
        app.coordinator().pause("v1");
        app.coordinator().resume_if_active("v1", "elsewhere.mp4");
        REQUIRE(app.wait_status("v1", DownloadStatus::paused));
        app.coordinator().drain();

        auto record = app.record("v1");
        CHECK(record->status == DownloadStatus::paused);
        CHECK(record->downloaded_bytes == 200'000);
        CHECK(app.transport->requests_for(url_of("elsewhere.mp4")).empty());
    }

    SECTION("Never started") {
        app.coordinator().resume_if_active("v2", "elsewhere.mp4");
        app.coordinator().drain();
        CHECK(app.record("v2")->status == DownloadStatus::not_started);
        CHECK(app.transport->requests().empty());
    }
}

TEST_CASE("Finished optimizing publishes VideoReady once", "[reconciler]") {
    App app;
    auto pending = make_video("v3", "v3.mp4", MB, true);
    app.serve("v3.mp4", MB);

    app.catalog->set({pending});
    (void)app.ctx->reconciler().refresh(CODE);
    app.coordinator().start("v3");
    app.coordinator().drain();
    auto refused = app.recorder->failures("v3");
    REQUIRE(refused.size() == 1);
    CHECK(refused[0].error == make_error_code(DownloadErrc::video_optimizing));

    auto ready = pending;
    ready.is_optimizing = false;
    app.catalog->set({ready});
    auto report = app.ctx->reconciler().refresh(CODE);
    CHECK(report.ready == std::vector<std::string>{"v3"});
    CHECK(app.count_ready("v3") == 1);
    CHECK_FALSE(app.record("v3")->video.is_optimizing);

    auto again = app.ctx->reconciler().refresh(CODE);
    CHECK(again.ready.empty());
    CHECK(app.count_ready("v3") == 1);

    app.coordinator().start("v3");
    REQUIRE(app.wait_status("v3", DownloadStatus::completed));
}

TEST_CASE("An unreachable catalog keeps local state and serves the cache", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", MB);
    auto v2 = make_video("v2", "v2.mp4", MB, true);
    app.catalog->set({v1, v2});
    (void)app.ctx->reconciler().refresh(CODE);
    auto tracked_before = app.coordinator().list_tracked_downloads();

    app.catalog->go_offline();
    auto report = app.ctx->reconciler().refresh(CODE);
    CHECK(report.offline);
    CHECK(report.videos == std::vector<RemoteVideo>{v1, v2});
    CHECK(report.no_changes());
    CHECK(app.ctx->reconciler().offline());
    CHECK(app.coordinator().list_tracked_downloads() == tracked_before);

    (void)app.ctx->reconciler().refresh(CODE);
    CHECK(app.offline_events() == std::vector<bool>{true});

    app.catalog->set({v1, v2});
    auto online = app.ctx->reconciler().refresh(CODE);
    CHECK_FALSE(online.offline);
    CHECK_FALSE(app.ctx->reconciler().offline());
    CHECK(app.offline_events() == std::vector<bool>{true, false});
}

TEST_CASE("The optimizing watcher polls until every video is ready", "[reconciler]") {
    App app;
    auto pending = make_video("v3", "v3.mp4", MB, true);
    app.catalog->set({pending});
    (void)app.ctx->reconciler().refresh(CODE);

    OptimizingWatcher watcher(app.ctx->reconciler(), std::chrono::milliseconds(10));
    watcher.start(CODE);
    REQUIRE(wait_until([&] { return watcher.polls() >= 2; }));
    CHECK(watcher.running());

    auto ready = pending;
    ready.is_optimizing = false;
    app.catalog->set({ready});

    REQUIRE(wait_until([&] { return !watcher.running(); }));
    watcher.wait();
    CHECK(app.count_ready("v3") == 1);
    CHECK(any_optimizing({pending}));
    CHECK_FALSE(any_optimizing({ready}));
}

TEST_CASE("AppContext sync and wipe", "[reconciler]") {
    App app;
    auto v1 = make_video("v1", "v1.mp4", MB);
    auto v2 = make_video("v2", "v2.mp4", MB, true);
    app.serve("v1.mp4", MB);
    app.catalog->set({v1, v2});

    auto report = app.ctx->sync(CODE);
    CHECK(report.added.size() == 2);
    CHECK(app.ctx->watcher().running());
    app.ctx->watcher().stop();

    app.coordinator().start("v1");
    REQUIRE(app.wait_status("v1", DownloadStatus::completed));
    REQUIRE(!app.ctx->bookmarks().set("v1", Bookmark{5.0, 1.0}));

    app.ctx->wipe();
    CHECK(app.coordinator().list_tracked_downloads().empty());
    CHECK_FALSE(app.ctx->bookmarks().contains("v1"));
    CHECK(!app.ctx->catalog_cache().load().has_value());
    CHECK_FALSE(fs::exists(app.coordinator().output_file("v1")));
}
