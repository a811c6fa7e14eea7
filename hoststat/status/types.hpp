/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-10

Description: Result types returned by the status queries

**************************************************/

#ifndef HOSTSTAT_STATUS_TYPES_HPP
#define HOSTSTAT_STATUS_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace hoststat::status {

/// Raw byte count, or the formatBytes() rendering when human readable
/// output was requested.
using ByteValue = std::variant<std::uint64_t, std::string>;

/**
 * @struct DiskUsage
 * @brief Usage of one volume. All three fields use the same form.
 */
struct DiskUsage {
    ByteValue total;
    ByteValue used;
    ByteValue free;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @struct ProcessInfo
 * @brief Per-process details. user and userDomain are both set or both
 * empty; they are empty when the owner could not be determined.
 */
struct ProcessInfo {
    std::string cmd;
    std::string name;
    std::optional<std::string> user;
    std::optional<std::string> userDomain;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

using ProcessTable = std::map<std::uint32_t, ProcessInfo>;

/// Process count, or the full table keyed by pid.
using ProcsResult = std::variant<std::size_t, ProcessTable>;

/// Seconds since boot, or the "[Years: Y ][Days: D ]HH:MM:SS" rendering.
using UptimeValue = std::variant<double, std::string>;

auto toJson(const ByteValue& value) -> nlohmann::json;
auto toJson(const ProcessTable& table) -> nlohmann::json;
auto toJson(const ProcsResult& result) -> nlohmann::json;
auto toJson(const UptimeValue& value) -> nlohmann::json;

}  // namespace hoststat::status

#endif  // HOSTSTAT_STATUS_TYPES_HPP
