// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace reel::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 500'000;               // 500 KB per segment
constexpr std::uint32_t MAX_CONCURRENT_SEGMENTS = 5;                // Per video
constexpr std::uint32_t MAX_ACTIVE_VIDEOS = 2;                      // Across videos
constexpr std::uint32_t MAX_SEGMENT_RETRIES = 5;
constexpr std::uint32_t HEAD_ATTEMPTS = 3;

constexpr std::chrono::milliseconds RETRY_DELAY{2000};
constexpr std::chrono::milliseconds MAX_RETRY_DELAY{30000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr std::chrono::seconds OPTIMIZING_POLL_INTERVAL{30};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t WRITE_BUFFER_SIZE = 64 * 1024;               // 64 KB

// Engine configuration. Every field can be overridden from a JSON file.
struct EngineConfig {
    // Base URL that catalog locators are resolved against
    std::string base_url;
    // Catalog endpoint; "{code}" is replaced with the access code
    std::string catalog_url;

    std::string data_dir{"reel-data"};
    std::string segment_dir;   // Empty: <data_dir>/parts
    std::string output_dir;    // Empty: <data_dir>/videos

    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_concurrent_segments{MAX_CONCURRENT_SEGMENTS};
    std::uint32_t max_active_videos{MAX_ACTIVE_VIDEOS};
    std::uint32_t max_segment_retries{MAX_SEGMENT_RETRIES};
    std::uint32_t head_attempts{HEAD_ATTEMPTS};
    std::chrono::milliseconds retry_delay{RETRY_DELAY};
    std::chrono::milliseconds max_retry_delay{MAX_RETRY_DELAY};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::seconds poll_interval{OPTIMIZING_POLL_INTERVAL};

    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};

    std::string log_level{"info"};
    std::string log_file;

    [[nodiscard]] std::string segment_path() const;
    [[nodiscard]] std::string output_path() const;

    // Backoff before retry number `attempt` (1-based), doubling up to max_retry_delay
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt) const noexcept;
};

// Load configuration from a JSON file; missing keys keep their defaults
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_config(std::string_view path) noexcept;

} // namespace reel::core
