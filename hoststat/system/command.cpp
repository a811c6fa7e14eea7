/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-12-24

Description: Simple wrapper for executing commands.

**************************************************/

#include "command.hpp"

#include <array>
#include <cstdio>
#include <memory>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"

namespace hoststat::system {

namespace {
#ifdef _WIN32
constexpr auto openPipe = _popen;
constexpr auto closePipe = _pclose;
#else
constexpr auto openPipe = popen;
constexpr auto closePipe = pclose;
#endif

auto exitStatus(int rawStatus) -> int {
#ifdef _WIN32
    return rawStatus;
#else
    if (rawStatus == -1) {
        return -1;
    }
    if (WIFEXITED(rawStatus)) {
        return WEXITSTATUS(rawStatus);
    }
    return 128 + WTERMSIG(rawStatus);
#endif
}
}  // namespace

auto ShellCommandRunner::run(const std::vector<std::string>& args)
    -> std::string {
    if (args.empty()) {
        THROW_COMMAND_ERROR(-1, "Empty command");
    }

    const std::string command = joinCommandLine(args);
    spdlog::debug("Running command: {}", command);

    auto pipeDeleter = [](FILE* pipe) { return closePipe(pipe); };
    std::unique_ptr<FILE, decltype(pipeDeleter)> pipe(
        openPipe(command.c_str(), "r"), pipeDeleter);
    if (!pipe) {
        THROW_COMMAND_ERROR(-1, "Failed to start command: ", command);
    }

    std::string output;
    std::array<char, 4096> buffer{};
    std::size_t count = 0;
    while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) >
           0) {
        output.append(buffer.data(), count);
    }

    const int status = exitStatus(closePipe(pipe.release()));
    if (status != 0) {
        THROW_COMMAND_ERROR(status, "Command '", command,
                            "' exited with status ", status);
    }
    return output;
}

auto joinCommandLine(const std::vector<std::string>& args) -> std::string {
    std::string result;
    for (const auto& arg : args) {
        if (!result.empty()) {
            result += ' ';
        }

        const bool needQuote =
            arg.empty() || arg.find_first_of(" \t") != std::string::npos;
        if (needQuote) {
            result += '"';
        }

        std::string pendingBackslashes;
        for (char ch : arg) {
            if (ch == '\\') {
                pendingBackslashes += ch;
            } else if (ch == '"') {
                result += pendingBackslashes + pendingBackslashes + "\\\"";
                pendingBackslashes.clear();
            } else {
                result += pendingBackslashes;
                pendingBackslashes.clear();
                result += ch;
            }
        }

        result += pendingBackslashes;
        if (needQuote) {
            result += pendingBackslashes;
            result += '"';
        }
    }
    return result;
}

}  // namespace hoststat::system
