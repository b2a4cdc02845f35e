// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace reel::log {

void init(std::string_view level, std::string_view file) noexcept {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string(file)));
        }

        auto logger = std::make_shared<spdlog::logger>("reel", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        spdlog::drop("reel");
        spdlog::set_default_logger(logger);
        set_level(level);
    } catch (const spdlog::spdlog_ex& e) {
        // Keep the stock default logger
        std::cerr << "log init failed: " << e.what() << std::endl;
    }
}

void set_level(std::string_view level) noexcept {
    spdlog::set_level(spdlog::level::from_str(std::string(level)));
}

} // namespace reel::log
