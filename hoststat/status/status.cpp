/*
 * status.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-10

Description: Point-in-time host status queries

**************************************************/

#include "status.hpp"

#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"
#include "hoststat/status/process_info.hpp"
#include "hoststat/sysinfo/disk.hpp"
#include "hoststat/utils/byte_format.hpp"
#include "hoststat/utils/string.hpp"
#include "hoststat/utils/time.hpp"

namespace hoststat::status {

namespace {
constexpr std::string_view K_LOAD_COLUMN = "LoadPercentage";

auto nonBlankLines(std::string_view output) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (auto& line : utils::splitLines(output)) {
        if (!utils::trim(line).empty()) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

auto toByteValue(std::uint64_t bytes, bool humanReadable) -> ByteValue {
    if (humanReadable) {
        return utils::formatBytes(bytes);
    }
    return bytes;
}

auto parseLoadValue(std::string_view text) -> int {
    auto value = utils::parseInteger(utils::trim(text));
    if (!value) {
        THROW_PARSE_ERROR("LoadPercentage is not an integer: '", text, "'");
    }
    return static_cast<int>(*value);
}
}  // namespace

auto parseCpuLoad(std::string_view output) -> int {
    const auto lines = nonBlankLines(output);
    if (lines.size() < 2) {
        THROW_PARSE_ERROR("cpu info output has no data row");
    }
    const auto& header = lines[0];
    const auto& row = lines[1];

    const auto column = header.find(K_LOAD_COLUMN);
    if (column == std::string::npos) {
        THROW_PARSE_ERROR("No ", K_LOAD_COLUMN, " column in cpu info output");
    }

    if (header.find(',') != std::string::npos) {
        const auto names = utils::splitString(header, ',');
        const auto fields = utils::splitString(row, ',');
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (utils::trim(names[i]) == K_LOAD_COLUMN) {
                if (i >= fields.size()) {
                    THROW_PARSE_ERROR("cpu info row is missing column ", i);
                }
                return parseLoadValue(fields[i]);
            }
        }
        THROW_PARSE_ERROR("No ", K_LOAD_COLUMN, " field in cpu info header");
    }

    // Fixed-width table: the value starts under the header and runs to the
    // next blank.
    if (column >= row.size()) {
        THROW_PARSE_ERROR("cpu info row is shorter than the header");
    }
    const auto tokens = utils::splitWhitespace(row.substr(column));
    if (tokens.empty()) {
        THROW_PARSE_ERROR("Empty ", K_LOAD_COLUMN, " value");
    }
    return parseLoadValue(tokens.front());
}

auto parseBootTime(std::string_view output, std::string_view marker,
                   std::string_view format)
    -> std::chrono::system_clock::time_point {
    std::optional<std::string> timestamp;
    for (const auto& line : utils::splitLines(output)) {
        const auto pos = utils::findIgnoreCase(line, marker);
        if (pos != std::string::npos) {
            timestamp = line.substr(pos + marker.size());
        }
    }
    if (!timestamp) {
        THROW_PARSE_ERROR("No '", marker, "' line in server statistics");
    }

    auto bootTime = utils::parseLocalTime(*timestamp, format);
    if (!bootTime) {
        THROW_PARSE_ERROR("Cannot parse boot time '", utils::trim(*timestamp),
                          "' with format ", format);
    }
    return *bootTime;
}

auto formatUptime(long long seconds) -> std::string {
    if (seconds < 0) {
        seconds = 0;
    }
    const auto secs = seconds % 60;
    seconds /= 60;
    const auto minutes = seconds % 60;
    seconds /= 60;
    const auto hours = seconds % 24;
    const auto days = seconds / 24;

    auto result = fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
    if (days > 0) {
        result = fmt::format("Days: {} {}", days % 365, result);
    }
    if (days >= 365) {
        result = fmt::format("Years: {} {}", days / 365, result);
    }
    return result;
}

StatusModule::StatusModule(const config::Options& options,
                           system::CommandRunner& runner,
                           system::ProcessQuery& processQuery)
    : options_(options), runner_(runner), processQuery_(processQuery) {}

auto StatusModule::cpuLoad() -> int {
    const auto output = runner_.run({"wmic", "cpu"});
    const int load = parseCpuLoad(output);
    spdlog::debug("CPU load {}%", load);
    return load;
}

auto StatusModule::diskUsage(bool humanReadable,
                             const std::optional<std::string>& path)
    -> DiskUsage {
    const std::string target =
        path && !path->empty() ? *path : options_.diskPath();
    const auto space = sysinfo::queryDiskSpace(target);
    const std::uint64_t used =
        space.total >= space.free ? space.total - space.free : 0;

    return DiskUsage{toByteValue(space.total, humanReadable),
                     toByteValue(used, humanReadable),
                     toByteValue(space.free, humanReadable)};
}

auto StatusModule::procs(bool count) -> ProcsResult {
    if (count) {
        return processCount();
    }
    return processTable();
}

auto StatusModule::processCount() -> std::size_t {
    return processQuery_.processes().size();
}

auto StatusModule::processTable() -> ProcessTable {
    ProcessTable table;
    for (const auto& process : processQuery_.processes()) {
        table[process->pid()] = getProcessInfo(*process);
    }
    return table;
}

auto StatusModule::agentMemory(bool humanReadable) -> ByteValue {
    const auto pid = system::currentProcessId();
    const auto workingSet = processQuery_.workingSet(pid);
    spdlog::debug("Working set of PID {} is {} bytes", pid, workingSet);
    return toByteValue(workingSet, humanReadable);
}

auto StatusModule::uptime(bool humanReadable) -> UptimeValue {
    return uptime(humanReadable, std::chrono::system_clock::now());
}

auto StatusModule::uptime(bool humanReadable,
                          std::chrono::system_clock::time_point now)
    -> UptimeValue {
    const auto output = runner_.run({"net", "stats", "srv"});
    const auto bootTime = parseBootTime(output, options_.uptimeMarker(),
                                        options_.uptimeTimeFormat());
    const double elapsed =
        std::chrono::duration<double>(now - bootTime).count();

    if (humanReadable) {
        return formatUptime(static_cast<long long>(elapsed));
    }
    return elapsed;
}

}  // namespace hoststat::status
