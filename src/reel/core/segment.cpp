// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/segment.hpp>
#include <reel/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <optional>

namespace reel::core {

std::expected<std::uint64_t, std::error_code>
SegmentFetcher::fetch(const SegmentJob& job, std::stop_token stop,
                      const SegmentProgressFn& on_progress) const noexcept {
    const auto& range = job.range;
    if (!range.open_ended && job.received > range.length()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    disk::FileWriter writer;
    if (auto ec = writer.open(job.file_path, job.received); ec) {
        spdlog::error("[{}] segment {}: cannot open {}: {}", job.video_id, job.index, job.file_path, ec.message());
        return std::unexpected(ec);
    }

    std::uint64_t received = writer.size();
    if (received < job.received) {
        spdlog::warn("[{}] segment {}: file holds {} of {} recorded bytes",
                     job.video_id, job.index, received, job.received);
    }

    // Already complete
    if (!range.open_ended && received == range.length()) {
        return received;
    }

    auto last_report = std::chrono::steady_clock::now();
    auto report = [&](bool force) {
        if (!on_progress) return;
        auto now = std::chrono::steady_clock::now();
        if (force || now - last_report >= progress_interval_) {
            last_report = now;
            on_progress(received);
        }
    };

    BodySink sink = [&](const char* data, std::size_t size) -> std::error_code {
        if (stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }
        if (!range.open_ended && received + size > range.length()) {
            return make_error_code(DownloadErrc::invalid_range);
        }
        if (auto ec = writer.write(data, size); ec) {
            return ec;
        }
        received += size;
        report(false);
        return {};
    };

    std::optional<std::uint64_t> last;
    if (!range.open_ended) {
        last = range.end - 1;
    }

    auto ec = transport_.get_range(job.url, range.start + received, last, sink, stop);

    // Whatever arrived stays on disk for the next attempt
    if (auto flush_ec = writer.flush(); flush_ec && !ec) {
        ec = flush_ec;
    }
    writer.close();
    report(true);

    if (!ec && stop.stop_requested()) {
        ec = make_error_code(DownloadErrc::cancelled);
    }
    if (ec) {
        if (ec != make_error_code(DownloadErrc::cancelled)) {
            spdlog::warn("[{}] segment {}: {} after {} bytes", job.video_id, job.index, ec.message(), received);
        }
        return std::unexpected(ec);
    }

    // Connection closed early
    if (!range.open_ended && received != range.length()) {
        spdlog::warn("[{}] segment {}: short body, {} of {} bytes", job.video_id, job.index,
                     received, range.length());
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    spdlog::debug("[{}] segment {} complete ({} bytes)", job.video_id, job.index, received);
    return received;
}

} // namespace reel::core
