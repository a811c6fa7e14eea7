/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-5-4

Description: Default logger configuration

**************************************************/

#ifndef HOSTSTAT_LOG_LOGGING_HPP
#define HOSTSTAT_LOG_LOGGING_HPP

#include <cstddef>
#include <string_view>

#include <spdlog/common.h>

namespace hoststat::config {
class Options;
}

namespace hoststat::log {

inline constexpr std::size_t K_LOG_FILE_SIZE = 1048576;
inline constexpr std::size_t K_LOG_FILE_COUNT = 3;

/**
 * @brief Converts a level name to a spdlog level.
 * @throws error::InvalidArgument for unknown names.
 */
auto parseLevel(std::string_view name) -> spdlog::level::level_enum;

/**
 * @brief Installs the "hoststat" logger as the spdlog default: colour
 * output on stderr, plus a rotating file when log_file is set.
 */
void setupLogging(const config::Options& options);

}  // namespace hoststat::log

#endif  // HOSTSTAT_LOG_LOGGING_HPP
