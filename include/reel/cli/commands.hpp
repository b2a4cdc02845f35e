// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/app_context.hpp>
#include <atomic>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace reel::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;
    std::vector<std::string> args;
    std::string config_path;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Set from the SIGINT handler; waiting commands pause their downloads and return
extern std::atomic<bool> interrupted;

// Run args.command against an engine built from app
[[nodiscard]] CliResult dispatch(const CliArgs& args, core::AppContext& app);

// Fetch the catalog for code and reconcile
[[nodiscard]] CliResult sync(core::AppContext& app, std::string_view code, bool quiet);

// Print every tracked download
[[nodiscard]] CliResult list(core::AppContext& app);

// Start the given ids and wait until none is active
[[nodiscard]] CliResult download(core::AppContext& app, const std::vector<std::string>& ids, bool quiet);

[[nodiscard]] CliResult pause(core::AppContext& app, const std::vector<std::string>& ids);
[[nodiscard]] CliResult remove(core::AppContext& app, const std::vector<std::string>& ids);

// Resume everything left downloading by a previous run
[[nodiscard]] CliResult restore(core::AppContext& app, bool quiet);

// Sync, then keep polling and downloading until interrupted
[[nodiscard]] CliResult watch(core::AppContext& app, std::string_view code, bool quiet);

// Delete all local state
[[nodiscard]] CliResult wipe(core::AppContext& app);

[[nodiscard]] CliResult bookmark(core::AppContext& app, const std::vector<std::string>& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
