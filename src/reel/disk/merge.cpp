// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/merge.hpp>
#include <reel/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

namespace reel::disk {

namespace {

// RAII read descriptor
struct ReadFd {
    int fd{-1};
    explicit ReadFd(const std::string& path) : fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {}
    ~ReadFd() { if (fd >= 0) ::close(fd); }
    ReadFd(const ReadFd&) = delete;
    ReadFd& operator=(const ReadFd&) = delete;
};

} // namespace

std::expected<std::uint64_t, std::error_code>
merge_files(const std::vector<std::string>& parts,
            std::string_view output,
            std::optional<std::uint64_t> expected_length) noexcept {
    const std::string target(output);
    const std::string staging = target + ".merging";

    FileWriter writer;
    if (auto ec = writer.open(staging, 0); ec) {
        return std::unexpected(ec);
    }

    std::vector<char> buffer(MERGE_BUFFER_SIZE);

    for (const auto& part : parts) {
        ReadFd in(part);
        if (in.fd < 0) {
            auto ec = from_errno(errno, DiskErrc::read_error);
            writer.close();
            (void)remove_file(staging);
            return std::unexpected(ec);
        }

        while (true) {
            auto n = ::read(in.fd, buffer.data(), buffer.size());
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                auto ec = from_errno(errno, DiskErrc::read_error);
                writer.close();
                (void)remove_file(staging);
                return std::unexpected(ec);
            }
            if (auto ec = writer.write(buffer.data(), static_cast<std::size_t>(n)); ec) {
                writer.close();
                (void)remove_file(staging);
                return std::unexpected(ec);
            }
        }
    }

    if (auto ec = writer.flush(); ec) {
        writer.close();
        (void)remove_file(staging);
        return std::unexpected(ec);
    }

    const std::uint64_t merged = writer.size();
    writer.close();

    if (expected_length && merged != *expected_length) {
        (void)remove_file(staging);
        return std::unexpected(make_error_code(DiskErrc::length_mismatch));
    }

    if (::rename(staging.c_str(), target.c_str()) != 0) {
        auto ec = from_errno(errno, DiskErrc::rename_error);
        (void)remove_file(staging);
        return std::unexpected(ec);
    }

    return merged;
}

} // namespace reel::disk
