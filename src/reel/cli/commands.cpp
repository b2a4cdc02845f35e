// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/error.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <type_traits>
#include <variant>

using namespace reel::core;

namespace chrono = std::chrono;

namespace reel::cli {

std::atomic<bool> interrupted{false};

namespace {

// Collects engine events for the waiting loop. Handlers run on engine
// threads, so they only record; rendering happens on the main thread.
class EventLog {
public:
    explicit EventLog(EventBus& bus)
        : bus_(bus)
        , id_(bus.subscribe([this](const DownloadEvent& e) { on_event(e); })) {}

    ~EventLog() { bus_.unsubscribe(id_); }

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Latest progress per id, and the messages queued since the last call
    void take(std::map<std::string, ProgressEvent>& progress, std::vector<std::string>& lines) {
        std::lock_guard lock(mutex_);
        progress = progress_;
        lines.swap(lines_);
        lines_.clear();
    }

    [[nodiscard]] int failures() const {
        std::lock_guard lock(mutex_);
        return failures_;
    }

private:
    void on_event(const DownloadEvent& event) {
        std::lock_guard lock(mutex_);
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ProgressEvent>) {
                progress_[e.video_id] = e;
            } else if constexpr (std::is_same_v<T, CompletedEvent>) {
                lines_.push_back(e.video_id + ": saved to " + e.output_path);
            } else if constexpr (std::is_same_v<T, FailedEvent>) {
                ++failures_;
                lines_.push_back(e.video_id + ": " + e.message);
            } else if constexpr (std::is_same_v<T, VideoReadyEvent>) {
                lines_.push_back(e.video_id + ": ready (" + e.title + ")");
            } else if constexpr (std::is_same_v<T, OfflineStateChangedEvent>) {
                lines_.push_back(e.offline ? "Catalog unreachable, working offline" : "Back online");
            }
        }, event);
    }

    EventBus& bus_;
    EventBus::SubscriptionId id_;
    mutable std::mutex mutex_;
    std::map<std::string, ProgressEvent> progress_;
    std::vector<std::string> lines_;
    int failures_{0};
};

// Pause everything still downloading; partial bytes stay for the next run
void pause_active(DownloadCoordinator& coordinator) {
    for (const auto& record : coordinator.list_tracked_downloads()) {
        if (record.status == DownloadStatus::downloading) {
            coordinator.pause(record.id());
        }
    }
    coordinator.drain();
}

// Wait until no download is active. With keep_going the loop only ends on
// interrupt. Returns 130 when interrupted, 1 when any download failed.
int wait_for_downloads(AppContext& app, EventLog& log, bool quiet, bool keep_going) {
    auto& coordinator = app.coordinator();
    ProgressBar bar;
    std::map<std::string, ProgressEvent> progress;
    std::vector<std::string> lines;

    auto render = [&] {
        log.take(progress, lines);
        if (quiet) return;
        for (const auto& line : lines) {
            ProgressBar::clear_line();
            std::cout << line << std::endl;
        }
        // Single line: bytes summed over unfinished downloads
        std::uint64_t current = 0;
        std::uint64_t total = 0;
        std::size_t running = 0;
        for (const auto& entry : progress) {
            const auto& p = entry.second;
            if (p.total_bytes > 0 && p.downloaded_bytes >= p.total_bytes) continue;
            current += p.downloaded_bytes;
            total += p.total_bytes;
            ++running;
        }
        if (running == 0) return;
        bar.label(running == 1 ? std::string("1 video") : std::to_string(running) + " videos");
        bar.update(current, total);
    };

    while (!interrupted.load()) {
        render();
        if (!keep_going && coordinator.active_count() == 0) break;
        std::this_thread::sleep_for(chrono::milliseconds(100));
    }

    if (interrupted.load()) {
        if (!quiet) {
            ProgressBar::clear_line();
            std::cout << "Interrupted, pausing downloads..." << std::endl;
        }
        pause_active(coordinator);
        return 130;
    }

    render();
    return log.failures() > 0 ? 1 : 0;
}

void print_report(const ReconcileReport& report) {
    if (report.offline) {
        std::cout << "Catalog unreachable, showing cached list" << std::endl;
    }
    auto section = [](std::string_view label, const std::vector<std::string>& ids) {
        if (ids.empty()) return;
        std::cout << label << ":";
        for (const auto& id : ids) std::cout << " " << id;
        std::cout << std::endl;
    };
    section("Added", report.added);
    section("Removed", report.removed);
    section("Resumed", report.resumed);
    section("Ready", report.ready);
    section("Updated", report.updated);
    if (!report.offline && report.no_changes()) {
        std::cout << "Up to date (" << report.videos.size() << " videos)" << std::endl;
    }
}

[[nodiscard]] CliResult missing_argument(std::string_view what) {
    std::cerr << "Error: missing " << what << std::endl;
    std::cout << "Use -h for help" << std::endl;
    return 2;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            }
            continue;
        }
        if (args.command.empty()) {
            args.command = arg;
        } else {
            args.args.push_back(arg);
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult dispatch(const CliArgs& args, AppContext& app) {
    const auto& cmd = args.command;

    if (cmd == "sync") {
        if (args.args.empty()) return missing_argument("access code");
        return sync(app, args.args.front(), args.quiet);
    }
    if (cmd == "list") return list(app);
    if (cmd == "download") {
        if (args.args.empty()) return missing_argument("video id");
        return download(app, args.args, args.quiet);
    }
    if (cmd == "pause") {
        if (args.args.empty()) return missing_argument("video id");
        return pause(app, args.args);
    }
    if (cmd == "remove") {
        if (args.args.empty()) return missing_argument("video id");
        return remove(app, args.args);
    }
    if (cmd == "restore") return restore(app, args.quiet);
    if (cmd == "watch") {
        if (args.args.empty()) return missing_argument("access code");
        return watch(app, args.args.front(), args.quiet);
    }
    if (cmd == "wipe") return wipe(app);
    if (cmd == "bookmark") {
        if (args.args.empty()) return missing_argument("video id");
        return bookmark(app, args.args);
    }

    std::cerr << "Error: unknown command '" << cmd << "'" << std::endl;
    std::cout << "Use -h for help" << std::endl;
    return 2;
}

CliResult sync(AppContext& app, std::string_view code, bool quiet) {
    EventLog log(app.events());
    auto report = app.sync(code);
    if (!quiet) print_report(report);

    std::map<std::string, ProgressEvent> progress;
    std::vector<std::string> lines;
    log.take(progress, lines);
    if (!quiet) {
        for (const auto& line : lines) std::cout << line << std::endl;
    }

    app.watcher().stop();
    return report.offline ? 1 : 0;
}

CliResult list(AppContext& app) {
    auto records = app.coordinator().list_tracked_downloads();
    if (records.empty()) {
        std::cout << "No tracked videos" << std::endl;
        return 0;
    }

    for (const auto& r : records) {
        std::cout << std::left << std::setw(24) << r.id() << " "
                  << std::setw(12) << to_string(r.status) << " ";
        if (r.total_bytes > 0) {
            std::cout << std::right << std::setw(5) << std::fixed << std::setprecision(1)
                      << r.fraction() * 100.0 << "% "
                      << format_bytes(r.downloaded_bytes) << "/" << format_bytes(r.total_bytes);
        } else if (r.downloaded_bytes > 0) {
            std::cout << format_bytes(r.downloaded_bytes);
        }
        if (r.video.is_optimizing) std::cout << " [optimizing]";
        if (!r.video.title.empty()) std::cout << "  " << r.video.title;
        if (r.error_message) std::cout << "  (" << *r.error_message << ")";
        std::cout << std::endl;
    }
    return 0;
}

CliResult download(AppContext& app, const std::vector<std::string>& ids, bool quiet) {
    EventLog log(app.events());
    for (const auto& id : ids) {
        app.coordinator().start(id);
    }
    app.coordinator().drain();
    return wait_for_downloads(app, log, quiet, false);
}

CliResult pause(AppContext& app, const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        app.coordinator().pause(id);
    }
    app.coordinator().drain();
    return 0;
}

CliResult remove(AppContext& app, const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        app.coordinator().remove(id);
    }
    app.coordinator().drain();
    return 0;
}

CliResult restore(AppContext& app, bool quiet) {
    EventLog log(app.events());
    app.coordinator().restore_in_progress();
    app.coordinator().drain();
    return wait_for_downloads(app, log, quiet, false);
}

CliResult watch(AppContext& app, std::string_view code, bool quiet) {
    EventLog log(app.events());
    app.coordinator().restore_in_progress();
    auto report = app.sync(code);
    if (!quiet) print_report(report);
    return wait_for_downloads(app, log, quiet, true);
}

CliResult wipe(AppContext& app) {
    app.wipe();
    std::cout << "All local downloads and bookmarks deleted" << std::endl;
    return 0;
}

CliResult bookmark(AppContext& app, const std::vector<std::string>& args) {
    const auto& id = args.front();
    auto& store = app.bookmarks();

    if (args.size() == 1) {
        auto mark = store.get(id);
        if (!mark) {
            std::cout << id << ": no bookmark" << std::endl;
            return 1;
        }
        std::cout << id << ": " << std::fixed << std::setprecision(1) << mark->position << "s" << std::endl;
        return 0;
    }

    char* end = nullptr;
    double position = std::strtod(args[1].c_str(), &end);
    if (end == args[1].c_str() || *end != '\0' || position < 0.0) {
        std::cerr << "Error: invalid position '" << args[1] << "'" << std::endl;
        return 2;
    }

    auto now = chrono::duration<double>(chrono::system_clock::now().time_since_epoch()).count();
    if (auto ec = store.set(id, Bookmark{position, now}); ec) {
        return std::unexpected(ec);
    }
    return 0;
}

//=============================================================================
// Help
//=============================================================================

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel " << reel::version.to_string() << " - offline video downloader\n\n";
    std::cout << "Usage: " << program_name << " [options] <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  sync <code>            Fetch the catalog and reconcile local downloads\n";
    std::cout << "  list                   Show tracked videos and their progress\n";
    std::cout << "  download <id>...       Download videos and wait for them\n";
    std::cout << "  pause <id>...          Pause downloads, keeping partial data\n";
    std::cout << "  remove <id>...         Delete local data for videos\n";
    std::cout << "  restore                Resume downloads interrupted by a previous run\n";
    std::cout << "  watch <code>           Sync, download and poll until interrupted\n";
    std::cout << "  bookmark <id> [secs]   Show or set the playback position\n";
    std::cout << "  wipe                   Delete every download, bookmark and cached catalog\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>    JSON configuration file\n";
    std::cout << "  -V, --verbose          Debug logging\n";
    std::cout << "  -q, --quiet            Only warnings and errors\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version information\n";
}

void print_version() noexcept {
    std::cout << "Reel " << reel::version.to_string() << "\n";
    std::cout << "Built " << reel::BUILD_DATE << " " << reel::BUILD_TIME << "\n";
    std::cout << "Copyright (c) 2026 changcheng967. All rights reserved.\n";
}

} // namespace reel::cli
