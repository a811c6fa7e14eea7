/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-5-4

Description: Default logger configuration

**************************************************/

#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "hoststat/config/options.hpp"
#include "hoststat/error/exception.hpp"
#include "hoststat/utils/string.hpp"

namespace hoststat::log {

auto parseLevel(std::string_view name) -> spdlog::level::level_enum {
    const auto lowered = utils::toLower(name);
    if (lowered == "warning") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && lowered != "off") {
        THROW_INVALID_ARGUMENT("Unknown log level: ", name);
    }
    return level;
}

void setupLogging(const config::Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    const auto logFile = options.logFile();
    if (!logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, K_LOG_FILE_SIZE, K_LOG_FILE_COUNT));
    }

    auto logger =
        std::make_shared<spdlog::logger>("hoststat", sinks.begin(), sinks.end());
    logger->set_level(parseLevel(options.logLevel()));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    spdlog::set_default_logger(logger);
}

}  // namespace hoststat::log
