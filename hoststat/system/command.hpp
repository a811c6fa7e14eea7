/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-12-24

Description: Simple wrapper for executing commands.

**************************************************/

#ifndef HOSTSTAT_SYSTEM_COMMAND_HPP
#define HOSTSTAT_SYSTEM_COMMAND_HPP

#include <string>
#include <vector>

namespace hoststat::system {

/**
 * @brief Runs an external command and returns what it wrote to stdout.
 *
 * Implementations throw error::CommandError when the command cannot be
 * started or exits with a non-zero status.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual auto run(const std::vector<std::string>& args) -> std::string = 0;
};

/**
 * @brief CommandRunner backed by the platform shell (popen / _popen).
 */
class ShellCommandRunner : public CommandRunner {
public:
    auto run(const std::vector<std::string>& args) -> std::string override;
};

/**
 * @brief Joins arguments into one command line using the quoting rules of
 * the Microsoft C runtime: arguments containing blanks are wrapped in
 * double quotes, embedded quotes are escaped and backslashes are doubled
 * only where they precede a quote.
 */
[[nodiscard]] auto joinCommandLine(const std::vector<std::string>& args)
    -> std::string;

}  // namespace hoststat::system

#endif
