/*
 * status.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-10

Description: Point-in-time host status queries

**************************************************/

#ifndef HOSTSTAT_STATUS_STATUS_HPP
#define HOSTSTAT_STATUS_STATUS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "hoststat/config/options.hpp"
#include "hoststat/status/types.hpp"
#include "hoststat/system/command.hpp"
#include "hoststat/system/process_query.hpp"

namespace hoststat::status {

/**
 * @brief Whether the status queries can run on this host. Only Windows
 * provides wmic, "net stats" and WMI.
 */
[[nodiscard]] constexpr auto isSupportedPlatform() -> bool {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

/**
 * @brief Extracts the LoadPercentage value from "wmic cpu" output.
 *
 * The first non-blank line is the header and the next non-blank line the
 * first processor. Both the fixed-width table and the comma separated
 * (/format:csv) layouts are accepted.
 *
 * @throws error::ParseError if the column is missing or the value is not
 * an integer.
 */
auto parseCpuLoad(std::string_view output) -> int;

/**
 * @brief Finds the boot time in "net stats srv" output.
 *
 * Uses the last line containing marker (case-insensitive); the text after
 * the marker is parsed as local time with format.
 *
 * @throws error::ParseError if no line matches or the timestamp does not
 * fit the format.
 */
auto parseBootTime(std::string_view output, std::string_view marker,
                   std::string_view format)
    -> std::chrono::system_clock::time_point;

/**
 * @brief Renders elapsed seconds as "[Years: Y ][Days: D ]HH:MM:SS".
 *
 * Days is printed from one day up and counts days modulo 365; Years is
 * printed from 365 days up. Negative input is treated as zero.
 */
auto formatUptime(long long seconds) -> std::string;

/**
 * @class StatusModule
 * @brief Synchronous, stateless host queries. Every call recomputes its
 * result from the OS; nothing is cached between calls.
 */
class StatusModule {
public:
    StatusModule(const config::Options& options,
                 system::CommandRunner& runner,
                 system::ProcessQuery& processQuery);

    /**
     * @brief Processor load as an integer percentage.
     */
    auto cpuLoad() -> int;

    /**
     * @brief Usage of the volume holding path (the disk_path option when
     * not given).
     * @throws error::SystemQueryError if the path is invalid.
     */
    auto diskUsage(bool humanReadable = false,
                   const std::optional<std::string>& path = std::nullopt)
        -> DiskUsage;

    /**
     * @brief Process count when count is true, otherwise details of every
     * process keyed by pid.
     */
    auto procs(bool count = false) -> ProcsResult;

    auto processCount() -> std::size_t;
    auto processTable() -> ProcessTable;

    /**
     * @brief Working set of this process.
     */
    auto agentMemory(bool humanReadable = false) -> ByteValue;

    /**
     * @brief Time since the server service started, measured against now.
     */
    auto uptime(bool humanReadable = false) -> UptimeValue;
    auto uptime(bool humanReadable, std::chrono::system_clock::time_point now)
        -> UptimeValue;

private:
    const config::Options& options_;
    system::CommandRunner& runner_;
    system::ProcessQuery& processQuery_;
};

}  // namespace hoststat::status

#endif  // HOSTSTAT_STATUS_STATUS_HPP
