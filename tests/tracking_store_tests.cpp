// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/core/tracking_store.hpp>
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

using namespace reel::core;
using reel::test::TempDir;
using reel::test::make_video;

TEST_CASE("TrackedDownload invariants", "[tracking]") {
    auto record = TrackedDownload::from_remote(make_video("abc", "abc.mp4", 1000));
    CHECK(record.status == DownloadStatus::not_started);
    CHECK(record.total_bytes == 1000);
    CHECK(record.downloaded_bytes == 0);
    CHECK(record.source_locator_snapshot == "abc.mp4");
    CHECK(record.valid());

    SECTION("Downloaded beyond total") {
        record.downloaded_bytes = 1001;
        CHECK_FALSE(record.valid());
    }

    SECTION("Completed requires every byte") {
        record.status = DownloadStatus::completed;
        record.downloaded_bytes = 999;
        CHECK_FALSE(record.valid());
        record.downloaded_bytes = 1000;
        CHECK(record.valid());
    }

    SECTION("Error carries a message, and only error does") {
        record.status = DownloadStatus::error;
        CHECK_FALSE(record.valid());
        record.error_message = "boom";
        CHECK(record.valid());
        record.status = DownloadStatus::paused;
        CHECK_FALSE(record.valid());
    }

    SECTION("Fraction") {
        record.downloaded_bytes = 250;
        CHECK(record.fraction() == Catch::Detail::Approx(0.25));
        record.total_bytes = 0;
        CHECK(record.fraction() == 0.0);
    }
}

TEST_CASE("DownloadStatus names", "[tracking]") {
    for (auto s : {DownloadStatus::not_started, DownloadStatus::downloading, DownloadStatus::paused,
                   DownloadStatus::completed, DownloadStatus::error}) {
        CHECK(status_from_string(to_string(s)) == s);
    }
    CHECK(!status_from_string("bogus").has_value());
}

TEST_CASE("TrackingStore persistence", "[tracking]") {
    TempDir dir;
    const auto path = dir.file("downloads.json");

    SECTION("Missing file opens empty") {
        TrackingStore store(path);
        REQUIRE(!store.open());
        CHECK(store.size() == 0);
        CHECK(!store.get("abc").has_value());
    }

    SECTION("Mutations survive reopening") {
        {
            TrackingStore store(path);
            REQUIRE(!store.open());

            auto a = TrackedDownload::from_remote(make_video("abc", "abc.mp4", 1000));
            a.status = DownloadStatus::paused;
            a.downloaded_bytes = 400;
            REQUIRE(!store.put(a));

            auto b = TrackedDownload::from_remote(make_video("xyz", "xyz.mp4", std::nullopt));
            b.status = DownloadStatus::error;
            b.error_message = "Segment 0 failed after 5 retries: Network error";
            REQUIRE(!store.put(b));

            REQUIRE(!store.put(TrackedDownload::from_remote(make_video("gone", "gone.mp4", 1))));
            REQUIRE(!store.erase("gone"));
            REQUIRE(!store.erase("never-there"));
        }

        TrackingStore reopened(path);
        REQUIRE(!reopened.open());
        REQUIRE(reopened.size() == 2);

        auto a = reopened.get("abc");
        REQUIRE(a.has_value());
        CHECK(a->status == DownloadStatus::paused);
        CHECK(a->downloaded_bytes == 400);
        CHECK(a->video.size_bytes == std::optional<std::uint64_t>(1000));

        auto b = reopened.get("xyz");
        REQUIRE(b.has_value());
        CHECK(b->status == DownloadStatus::error);
        CHECK(b->error_message == std::optional<std::string>("Segment 0 failed after 5 retries: Network error"));
        CHECK(!b->video.size_bytes.has_value());
        CHECK_FALSE(reopened.contains("gone"));
    }

    SECTION("Records breaking invariants are reset on load") {
        reel::test::write_file(path, R"({"version":1,"downloads":[
            {"video":{"id":"abc","filename":"abc.mp4","size":100,"optimizing":false,"title":"A"},
             "status":"completed","downloadedBytes":50,"totalBytes":100,"errorMessage":null}
        ]})");

        TrackingStore store(path);
        REQUIRE(!store.open());
        auto a = store.get("abc");
        REQUIRE(a.has_value());
        CHECK(a->status == DownloadStatus::not_started);
        CHECK(a->downloaded_bytes == 0);
        CHECK(a->video.title == "A");
    }

    SECTION("Unreadable file") {
        reel::test::write_file(path, "not json");
        TrackingStore store(path);
        CHECK(store.open() == make_error_code(DownloadErrc::corrupt_state));
        CHECK(store.size() == 0);
    }

    SECTION("Clear deletes the file") {
        TrackingStore store(path);
        REQUIRE(!store.open());
        REQUIRE(!store.put(TrackedDownload::from_remote(make_video("abc", "abc.mp4", 1))));
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(!store.clear());
        CHECK_FALSE(std::filesystem::exists(path));
        CHECK(store.size() == 0);
    }
}

TEST_CASE("RemoteVideo from catalog rows", "[tracking]") {
    SECTION("Server processing status marks optimizing") {
        auto j = nlohmann::json::parse(R"({"id":"v1","filename":"v1.mp4","size":10,"status":"PROCESSING"})");
        auto v = j.get<RemoteVideo>();
        CHECK(v.is_optimizing);
    }

    SECTION("Processed status is ready") {
        auto j = nlohmann::json::parse(R"({"id":"v1","filename":"v1.mp4","status":"POST_PROCESSING_SUCCESS"})");
        auto v = j.get<RemoteVideo>();
        CHECK_FALSE(v.is_optimizing);
        CHECK(!v.size_bytes.has_value());
    }

    SECTION("Non-positive size is unknown") {
        auto j = nlohmann::json::parse(R"({"id":"v1","filename":"v1.mp4","size":0})");
        CHECK(!j.get<RemoteVideo>().size_bytes.has_value());
    }
}
