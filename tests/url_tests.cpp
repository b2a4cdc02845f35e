// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/core/url.hpp>

using namespace reel::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://cdn.example.com/media/abc.mp4");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "cdn.example.com");
        CHECK(url.path() == "/media/abc.mp4");
        CHECK(url.full() == "https://cdn.example.com/media/abc.mp4");
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://localhost:8080/videos");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->port() == "8080");
        CHECK(result->full() == "http://localhost:8080/videos");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/abc.mp4?token=1#t=30");
        REQUIRE(result.has_value());
        CHECK(result->query() == "token=1");
        CHECK(result->fragment() == "t=30");
        CHECK(result->full() == "https://example.com/abc.mp4?token=1#t=30");
    }

    SECTION("Bare host gets a root path") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        CHECK(!Url::parse("example.com/abc.mp4").has_value());
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Missing host") {
        CHECK(!Url::parse("https:///abc.mp4").has_value());
    }
}

TEST_CASE("Url::join resolves catalog locators", "[url]") {
    SECTION("Relative locator under a base path") {
        auto url = Url::join("https://cdn.example.com/media/", "abc.mp4");
        REQUIRE(url.has_value());
        CHECK(url->full() == "https://cdn.example.com/media/abc.mp4");
    }

    SECTION("Slashes are not doubled") {
        auto url = Url::join("https://cdn.example.com/media", "/abc.mp4");
        REQUIRE(url.has_value());
        CHECK(url->full() == "https://cdn.example.com/media/abc.mp4");
    }

    SECTION("Base without a path") {
        auto url = Url::join("https://cdn.example.com", "abc.mp4");
        REQUIRE(url.has_value());
        CHECK(url->full() == "https://cdn.example.com/abc.mp4");
    }

    SECTION("Nested locator keeps its directories") {
        auto url = Url::join("https://cdn.example.com/", "2024/08/abc_1080p.mp4");
        REQUIRE(url.has_value());
        CHECK(url->path() == "/2024/08/abc_1080p.mp4");
    }

    SECTION("Spaces are percent-encoded") {
        auto url = Url::join("https://cdn.example.com/", "my video.mp4");
        REQUIRE(url.has_value());
        CHECK(url->path() == "/my%20video.mp4");
    }

    SECTION("Absolute locator replaces the base") {
        auto url = Url::join("https://cdn.example.com/media/", "https://other.example.com/x.mp4");
        REQUIRE(url.has_value());
        CHECK(url->host() == "other.example.com");
        CHECK(url->path() == "/x.mp4");
    }

    SECTION("Query of the base is dropped") {
        auto url = Url::join("https://cdn.example.com/media/?list=1", "abc.mp4");
        REQUIRE(url.has_value());
        CHECK(url->query().empty());
    }

    SECTION("Empty locator is rejected") {
        auto url = Url::join("https://cdn.example.com/", "");
        REQUIRE(!url.has_value());
        CHECK(url.error() == make_error_code(DownloadErrc::invalid_url));
    }

    SECTION("Invalid base is rejected") {
        CHECK(!Url::join("not a url", "abc.mp4").has_value());
    }
}

TEST_CASE("encode_path", "[url]") {
    CHECK(encode_path("abc.mp4") == "abc.mp4");
    CHECK(encode_path("a b") == "a%20b");
    CHECK(encode_path("dir/file#1.mp4") == "dir/file%231.mp4");
    CHECK(encode_path("?") == "%3F");
}
