// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/core/segment_planner.hpp>

using namespace reel::core;

TEST_CASE("plan_segments covers the file exactly", "[planner]") {
    auto [total, chunk] = GENERATE(table<std::uint64_t, std::uint64_t>({
        {1, 1},
        {1, 500'000},
        {499'999, 500'000},
        {500'000, 500'000},
        {500'001, 500'000},
        {3'000'000, 1'000'000},
        {5'000'000'000ULL, 500'000},
        {7, 3},
    }));

    auto ranges = plan_segments(total, chunk);
    REQUIRE(ranges.has_value());
    REQUIRE(ranges->size() == segment_count(total, chunk));
    REQUIRE(ranges->size() == (total + chunk - 1) / chunk);

    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < ranges->size(); ++i) {
        const auto& r = (*ranges)[i];
        CHECK_FALSE(r.open_ended);
        CHECK(r.start == expected_start);
        CHECK(r.end > r.start);
        if (i + 1 < ranges->size()) {
            CHECK(r.length() == chunk);
        } else {
            CHECK(r.length() <= chunk);
        }
        expected_start = r.end;
    }
    CHECK(expected_start == total);
}

TEST_CASE("plan_segments edge cases", "[planner]") {
    SECTION("Three chunks of one megabyte") {
        auto ranges = plan_segments(3'000'000, 1'000'000);
        REQUIRE(ranges.has_value());
        REQUIRE(ranges->size() == 3);
        CHECK((*ranges)[1] == ByteRange{1'000'000, 2'000'000, false});
        CHECK((*ranges)[2] == ByteRange{2'000'000, 3'000'000, false});
    }

    SECTION("Unknown size yields one open-ended range") {
        auto ranges = plan_segments(0, 500'000);
        REQUIRE(ranges.has_value());
        REQUIRE(ranges->size() == 1);
        CHECK(ranges->front().open_ended);
        CHECK(ranges->front().start == 0);
    }

    SECTION("Zero chunk size is an error") {
        auto ranges = plan_segments(1000, 0);
        REQUIRE(!ranges.has_value());
        CHECK(ranges.error() == make_error_code(DownloadErrc::invalid_range));
        CHECK(segment_count(1000, 0) == 0);
    }

    SECTION("Deterministic") {
        CHECK(plan_segments(1'234'567, 100'000) == plan_segments(1'234'567, 100'000));
    }
}
