// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <reel/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace reel::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

void read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = std::chrono::milliseconds{j[key].get<std::int64_t>()};
    }
}

} // namespace

std::string EngineConfig::segment_path() const {
    if (!segment_dir.empty()) return segment_dir;
    return (std::filesystem::path(data_dir) / "parts").string();
}

std::string EngineConfig::output_path() const {
    if (!output_dir.empty()) return output_dir;
    return (std::filesystem::path(data_dir) / "videos").string();
}

std::chrono::milliseconds EngineConfig::backoff(std::uint32_t attempt) const noexcept {
    auto delay = retry_delay;
    for (std::uint32_t i = 1; i < attempt && delay < max_retry_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_retry_delay);
}

std::expected<EngineConfig, std::error_code>
load_config(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
        }

        EngineConfig cfg;
        read_key(j, "base_url", cfg.base_url);
        read_key(j, "catalog_url", cfg.catalog_url);
        read_key(j, "data_dir", cfg.data_dir);
        read_key(j, "segment_dir", cfg.segment_dir);
        read_key(j, "output_dir", cfg.output_dir);
        read_key(j, "chunk_size", cfg.chunk_size);
        read_key(j, "max_concurrent_segments", cfg.max_concurrent_segments);
        read_key(j, "max_active_videos", cfg.max_active_videos);
        read_key(j, "max_segment_retries", cfg.max_segment_retries);
        read_key(j, "head_attempts", cfg.head_attempts);
        read_ms(j, "retry_delay_ms", cfg.retry_delay);
        read_ms(j, "max_retry_delay_ms", cfg.max_retry_delay);
        read_ms(j, "progress_interval_ms", cfg.progress_interval);
        if (j.contains("poll_interval_sec")) {
            cfg.poll_interval = std::chrono::seconds{j["poll_interval_sec"].get<std::int64_t>()};
        }
        read_key(j, "connect_timeout_sec", cfg.connect_timeout_sec);
        read_key(j, "stall_timeout_sec", cfg.stall_timeout_sec);
        read_key(j, "log_level", cfg.log_level);
        read_key(j, "log_file", cfg.log_file);

        if (cfg.chunk_size == 0 || cfg.max_concurrent_segments == 0 || cfg.max_active_videos == 0) {
            spdlog::error("config {}: chunk_size and concurrency limits must be positive", path);
            return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config {}: {}", path, e.what());
        return std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    } catch (const std::exception& e) {
        spdlog::error("config {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace reel::core
