// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <reel/disk/file_writer.hpp>
#include <reel/disk/merge.hpp>
#include "test_support.hpp"
#include <filesystem>

using namespace reel::disk;
using reel::test::TempDir;
using reel::test::read_file;
using reel::test::write_file;

TEST_CASE("merge_files concatenates in order", "[disk]") {
    TempDir dir;
    auto content = reel::test::make_content(700'000);

    std::vector<std::string> parts;
    for (std::size_t i = 0, offset = 0; offset < content.size(); ++i, offset += 300'000) {
        auto part = dir.file("p" + std::to_string(i));
        write_file(part, std::string_view(content).substr(offset, 300'000));
        parts.push_back(part);
    }
    REQUIRE(parts.size() == 3);

    const auto output = dir.file("videos/out.mp4");

    SECTION("Expected length matches") {
        auto merged = merge_files(parts, output, content.size());
        REQUIRE(merged.has_value());
        CHECK(*merged == content.size());
        CHECK(read_file(output) == content);
        CHECK_FALSE(std::filesystem::exists(output + ".merging"));
        // Parts are left for the caller to delete
        CHECK(std::filesystem::exists(parts[0]));
    }

    SECTION("Unknown length") {
        auto merged = merge_files(parts, output, std::nullopt);
        REQUIRE(merged.has_value());
        CHECK(*merged == content.size());
    }

    SECTION("Length mismatch leaves no output") {
        auto merged = merge_files(parts, output, content.size() + 1);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == make_error_code(DiskErrc::length_mismatch));
        CHECK_FALSE(std::filesystem::exists(output));
        CHECK_FALSE(std::filesystem::exists(output + ".merging"));
    }

    SECTION("Missing part") {
        parts.push_back(dir.file("missing"));
        auto merged = merge_files(parts, output, std::nullopt);
        REQUIRE(!merged.has_value());
        CHECK(merged.error() == make_error_code(DiskErrc::file_not_found));
        CHECK_FALSE(std::filesystem::exists(output));
    }

    SECTION("Existing output is replaced") {
        write_file(output, "stale");
        REQUIRE(merge_files(parts, output, content.size()).has_value());
        CHECK(read_file(output) == content);
    }
}

TEST_CASE("merge_files copies parts larger than its buffer", "[disk]") {
    TempDir dir;
    auto big = reel::test::make_content(2 * MERGE_BUFFER_SIZE + 17);
    auto small = reel::test::make_content(5);

    const auto first = dir.file("p0");
    const auto second = dir.file("p1");
    write_file(first, big);
    write_file(second, small);

    const auto output = dir.file("out.mp4");
    auto merged = merge_files({first, second}, output, big.size() + small.size());
    REQUIRE(merged.has_value());
    CHECK(read_file(output) == big + small);
}

TEST_CASE("FileWriter keeps recorded bytes and appends", "[disk]") {
    TempDir dir;
    const auto path = dir.file("parts/seg.tmp");

    {
        FileWriter writer;
        REQUIRE(!writer.open(path, 0));
        REQUIRE(!writer.write("hello world", 11));
        REQUIRE(!writer.flush());
        CHECK(writer.size() == 11);
    }
    CHECK(file_size(path) == 11);

    // A resume that only trusts 5 bytes drops the tail
    FileWriter writer;
    REQUIRE(!writer.open(path, 5));
    CHECK(writer.size() == 5);
    REQUIRE(!writer.write(", reel", 6));
    writer.close();
    CHECK(read_file(path) == "hello, reel");

    // Asking for more than exists keeps what is there
    REQUIRE(!writer.open(path, 100));
    CHECK(writer.size() == 11);
}

TEST_CASE("File helpers", "[disk]") {
    TempDir dir;

    SECTION("write_file_atomic creates parents and replaces") {
        auto path = dir.file("a/b/state.json");
        REQUIRE(!write_file_atomic(path, "one"));
        REQUIRE(!write_file_atomic(path, "two"));
        CHECK(read_file(path) == "two");
        CHECK_FALSE(std::filesystem::exists(path + ".tmp"));
    }

    SECTION("remove_file tolerates missing files") {
        CHECK(!remove_file(dir.file("nothing")));
        CHECK(file_size(dir.file("nothing")) == 0);
    }

    SECTION("sanitize_file_name") {
        CHECK(sanitize_file_name("abc") == "abc");
        auto s = sanitize_file_name("../etc/passwd");
        CHECK(s.find('/') == std::string::npos);
        CHECK(s != "..");
        CHECK_FALSE(sanitize_file_name("").empty());
    }
}
