// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/core/catalog.hpp>
#include "test_support.hpp"

using namespace reel::core;
using reel::test::FakeTransport;
using reel::test::TempDir;
using reel::test::make_video;

TEST_CASE("parse_catalog", "[catalog]") {
    SECTION("Bare array") {
        auto videos = parse_catalog(R"([
            {"id":"v1","filename":"v1.mp4","size":1000,"title":"First"},
            {"id":"v2","filename":"v2.mp4","status":"PROCESSING"}
        ])");
        REQUIRE(videos.has_value());
        REQUIRE(videos->size() == 2);
        CHECK((*videos)[0].id == "v1");
        CHECK((*videos)[0].source_locator == "v1.mp4");
        CHECK((*videos)[0].size_bytes == std::optional<std::uint64_t>(1000));
        CHECK((*videos)[0].title == "First");
        CHECK((*videos)[1].is_optimizing);
    }

    SECTION("Wrapped in an object") {
        auto videos = parse_catalog(R"({"videos":[{"id":"v1","filename":"v1.mp4"}]})");
        REQUIRE(videos.has_value());
        CHECK(videos->size() == 1);
    }

    SECTION("Empty catalog") {
        auto videos = parse_catalog("[]");
        REQUIRE(videos.has_value());
        CHECK(videos->empty());
    }

    SECTION("One malformed entry fails the whole document") {
        auto videos = parse_catalog(R"([{"id":"v1","filename":"v1.mp4"},{"id":"v2"}])");
        REQUIRE(!videos.has_value());
        CHECK(videos.error() == make_error_code(DownloadErrc::corrupt_state));
    }

    SECTION("Not JSON") {
        CHECK(!parse_catalog("<html>").has_value());
    }
}

TEST_CASE("HttpCatalogClient", "[catalog]") {
    FakeTransport transport;
    HttpCatalogClient client(transport, "https://api.example.com/catalog?code={code}");

    SECTION("Code is percent-encoded into the template") {
        CHECK(client.catalog_url("AB 12&x") == "https://api.example.com/catalog?code=AB%2012%26x");
    }

    SECTION("Fetches and parses") {
        transport.set_body(client.catalog_url("ABC"), R"([{"id":"v1","filename":"v1.mp4"}])");
        auto videos = client.fetch_catalog("ABC");
        REQUIRE(videos.has_value());
        CHECK(videos->front().id == "v1");
    }

    SECTION("Network failure is catalog_unreachable") {
        auto videos = client.fetch_catalog("ABC");
        REQUIRE(!videos.has_value());
        CHECK(videos.error() == make_error_code(DownloadErrc::catalog_unreachable));
    }

    SECTION("No template configured") {
        HttpCatalogClient unset(transport, "");
        auto videos = unset.fetch_catalog("ABC");
        REQUIRE(!videos.has_value());
        CHECK(videos.error() == make_error_code(DownloadErrc::invalid_url));
    }
}

TEST_CASE("CatalogCache", "[catalog]") {
    TempDir dir;
    CatalogCache cache(dir.file("catalog_cache.json"));

    CHECK(!cache.load().has_value());

    std::vector<RemoteVideo> videos{
        make_video("v1", "v1.mp4", 1000),
        make_video("v2", "v2.mp4", std::nullopt, true),
    };
    REQUIRE(!cache.save(videos));

    auto loaded = cache.load();
    REQUIRE(loaded.has_value());
    CHECK(*loaded == videos);

    REQUIRE(!cache.clear());
    CHECK(!cache.load().has_value());
}
