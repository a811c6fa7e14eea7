/*
 * cli.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-14

Description: Command-line front end for the status queries

**************************************************/

#ifndef HOSTSTAT_APP_CLI_HPP
#define HOSTSTAT_APP_CLI_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "hoststat/status/master.hpp"
#include "hoststat/status/status.hpp"

namespace hoststat::app {

inline constexpr int K_EXIT_OK = 0;
inline constexpr int K_EXIT_FAILURE = 1;
inline constexpr int K_EXIT_USAGE = 2;

/**
 * @struct Invocation
 * @brief Parsed "hoststat [options] FUNCTION [key=value ...]" command line.
 */
struct Invocation {
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;
    /// --option KEY=VALUE overrides, applied on top of the config file.
    std::map<std::string, std::string> overrides;
    std::string function;
    std::map<std::string, std::string> arguments;
};

/**
 * @brief Parses the arguments following the program name.
 * @throws error::InvalidArgument on malformed input.
 */
auto parseInvocation(const std::vector<std::string>& args) -> Invocation;

/**
 * @brief Parses true/false/1/0/yes/no, case-insensitively.
 * @throws error::InvalidArgument for anything else.
 */
auto parseBool(std::string_view text) -> bool;

/**
 * @brief Names accepted as FUNCTION.
 */
auto functionNames() -> const std::vector<std::string>&;

auto usage() -> std::string;

/**
 * @brief Serializes a result or event for output. Invalid UTF-8 in strings
 * is replaced with U+FFFD instead of failing.
 */
auto renderJson(const nlohmann::json& value, int indent = -1) -> std::string;

/**
 * @brief Runs one query and returns its result as JSON.
 *
 * master returns the tag of the fired event, or null when no event fired.
 *
 * @throws error::InvalidArgument for an unknown function or argument.
 */
auto runFunction(const Invocation& invocation, status::StatusModule& module,
                 status::MasterMonitor& monitor) -> nlohmann::json;

}  // namespace hoststat::app

#endif  // HOSTSTAT_APP_CLI_HPP
