// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/logging.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace reel::cli;

// Terminate handler to catch exceptions in noexcept functions
static void reel_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

extern "C" void reel_on_sigint(int) {
    interrupted.store(true);
}

int main(int argc, char* argv[]) {
    std::set_terminate(reel_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version || args.command == "version") {
        print_version();
        return 0;
    }
    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    reel::core::EngineConfig config;
    if (!args.config_path.empty()) {
        auto loaded = reel::core::load_config(args.config_path);
        if (!loaded) {
            std::cerr << "Error: cannot load " << args.config_path << ": " << loaded.error().message() << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }

    std::string level = config.log_level;
    if (args.verbose) level = "debug";
    if (args.quiet) level = "warn";
    reel::log::init(level, config.log_file);

    std::signal(SIGINT, reel_on_sigint);
    reel::core::HttpSession::global_init();

    int exit_code = 0;
    {
        auto app = reel::core::AppContext::create(std::move(config));
        if (!app) {
            std::cerr << "Error: " << app.error().message() << std::endl;
            reel::core::HttpSession::global_cleanup();
            return 1;
        }

        auto result = dispatch(args, **app);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            exit_code = 1;
        } else {
            exit_code = *result;
        }
    }

    reel::core::HttpSession::global_cleanup();
    return exit_code;
}
