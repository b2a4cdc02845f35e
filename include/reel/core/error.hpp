// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace reel::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    invalid_url,
    invalid_range,
    cancelled,
    size_unknown,
    segment_transfer_failed,
    merge_failed,
    catalog_unreachable,
    size_mismatch,
    video_optimizing,
    unknown_video,
    already_completed,
    corrupt_state,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                 return "Success";
            case DownloadErrc::network_error:           return "Network error";
            case DownloadErrc::timeout:                 return "Operation timed out";
            case DownloadErrc::not_found:               return "The file was not found on the server";
            case DownloadErrc::server_error:            return "Server error (5xx)";
            case DownloadErrc::invalid_url:             return "Invalid URL";
            case DownloadErrc::invalid_range:           return "Invalid byte range";
            case DownloadErrc::cancelled:               return "Download cancelled";
            case DownloadErrc::size_unknown:            return "Remote size unknown";
            case DownloadErrc::segment_transfer_failed: return "Segment transfer failed after retries";
            case DownloadErrc::merge_failed:            return "Could not merge downloaded segments";
            case DownloadErrc::catalog_unreachable:     return "Catalog unreachable";
            case DownloadErrc::size_mismatch:           return "Remote size changed since the download was planned";
            case DownloadErrc::video_optimizing:        return "Video is still being optimized";
            case DownloadErrc::unknown_video:           return "Unknown video id";
            case DownloadErrc::already_completed:       return "Video already downloaded";
            case DownloadErrc::corrupt_state:           return "Persisted state is corrupt";
            default:                                    return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::DownloadErrc> : true_type {};

} // namespace std
