// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::disk {

// Append-only writer for one segment file. Opening truncates the file to the
// number of bytes already accounted for, so a resumed transfer continues
// exactly where the recorded progress ends.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (creating if needed) and keep the first keep_bytes bytes
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t keep_bytes) noexcept;

    // Append data at the end of the file
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush to stable storage
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t size_{0};
};

// Size of a regular file, 0 when it does not exist
[[nodiscard]] std::uint64_t file_size(std::string_view path) noexcept;

// Replace path with contents via <path>.tmp + rename, creating parent directories
[[nodiscard]] std::error_code write_file_atomic(std::string_view path, std::string_view contents) noexcept;

// Remove a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

// Create a directory tree
[[nodiscard]] std::error_code ensure_directory(std::string_view path) noexcept;

// Map an identifier onto a name safe to use as a single path component
[[nodiscard]] std::string sanitize_file_name(std::string_view name);

} // namespace reel::disk
