// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <cerrno>
#include <cctype>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace reel::disk {

namespace fs = std::filesystem;

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , size_(other.size_) {
    other.fd_ = -1;
    other.size_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        size_ = other.size_;
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t keep_bytes) noexcept {
    close();
    path_ = path;

    if (auto ec = ensure_directory(fs::path(path_).parent_path().string()); ec) {
        return ec;
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return from_errno(errno, DiskErrc::handle_invalid);
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        auto ec = from_errno(errno, DiskErrc::read_error);
        close();
        return ec;
    }

    // Drop anything past the recorded progress (torn tail of an interrupted write)
    auto current = static_cast<std::uint64_t>(st.st_size);
    if (current > keep_bytes) {
        if (::ftruncate(fd_, static_cast<off_t>(keep_bytes)) != 0) {
            auto ec = from_errno(errno, DiskErrc::write_error);
            close();
            return ec;
        }
        current = keep_bytes;
    }

    if (::lseek(fd_, static_cast<off_t>(current), SEEK_SET) < 0) {
        auto ec = from_errno(errno, DiskErrc::seek_error);
        close();
        return ec;
    }

    size_ = current;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        auto n = ::write(fd_, bytes + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        written += static_cast<std::size_t>(n);
    }
    size_ += written;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Helpers
//=============================================================================

std::uint64_t file_size(std::string_view path) noexcept {
    std::error_code ec;
    auto size = fs::file_size(fs::path(path), ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::error_code write_file_atomic(std::string_view path, std::string_view contents) noexcept {
    try {
        fs::path target(path);
        if (target.has_parent_path()) {
            if (auto ec = ensure_directory(target.parent_path().string()); ec) {
                return ec;
            }
        }

        std::string tmp = std::string(path) + ".tmp";
        FileWriter writer;
        if (auto ec = writer.open(tmp, 0); ec) {
            return ec;
        }
        if (auto ec = writer.write(contents.data(), contents.size()); ec) {
            return ec;
        }
        if (auto ec = writer.flush(); ec) {
            return ec;
        }
        writer.close();

        if (::rename(tmp.c_str(), target.c_str()) != 0) {
            return from_errno(errno, DiskErrc::rename_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code remove_file(std::string_view path) noexcept {
    std::error_code ec;
    fs::remove(fs::path(path), ec);
    return ec;
}

std::error_code ensure_directory(std::string_view path) noexcept {
    if (path.empty()) return {};
    std::error_code ec;
    fs::create_directories(fs::path(path), ec);
    if (ec) {
        return make_error_code(DiskErrc::invalid_path);
    }
    return {};
}

std::string sanitize_file_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        out += (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.') ? ch : '_';
    }
    if (out.empty() || out == "." || out == "..") {
        out.insert(out.begin(), '_');
    }
    return out;
}

} // namespace reel::disk
