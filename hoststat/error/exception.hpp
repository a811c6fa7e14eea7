/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exceptions carrying their throw site

**************************************************/

#ifndef HOSTSTAT_ERROR_EXCEPTION_HPP
#define HOSTSTAT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "hoststat/macro.hpp"

namespace hoststat::error {

/**
 * @brief Base exception recording file, line, function and thread of the
 * throw site. The message is built by streaming every extra argument.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char *file, int line, const char *func, Args &&...args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    auto what() const noexcept -> const char * override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    mutable std::string full_message_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Expected marker text or column is missing from command output.
 */
class ParseError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief An operating system query reported failure.
 */
class SystemQueryError : public Exception {
public:
    template <typename... Args>
    SystemQueryError(const char *file, int line, const char *func, long code,
                     Args &&...args)
        : Exception(file, line, func, std::forward<Args>(args)...),
          code_(code) {}

    [[nodiscard]] auto code() const noexcept -> long { return code_; }

private:
    long code_;
};

/**
 * @brief A subprocess could not be started or exited with a non-zero status.
 */
class CommandError : public Exception {
public:
    template <typename... Args>
    CommandError(const char *file, int line, const char *func, int status,
                 Args &&...args)
        : Exception(file, line, func, std::forward<Args>(args)...),
          status_(status) {}

    [[nodiscard]] auto status() const noexcept -> int { return status_; }

private:
    int status_;
};

}  // namespace hoststat::error

#define THROW_RUNTIME_ERROR(...)                                       \
    throw hoststat::error::RuntimeError(HOSTSTAT_FILE_NAME,            \
                                        HOSTSTAT_FILE_LINE,            \
                                        HOSTSTAT_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw hoststat::error::InvalidArgument(HOSTSTAT_FILE_NAME,            \
                                           HOSTSTAT_FILE_LINE,            \
                                           HOSTSTAT_FUNC_NAME, __VA_ARGS__)

#define THROW_PARSE_ERROR(...)                                        \
    throw hoststat::error::ParseError(HOSTSTAT_FILE_NAME,             \
                                      HOSTSTAT_FILE_LINE,             \
                                      HOSTSTAT_FUNC_NAME, __VA_ARGS__)

#define THROW_SYSTEM_QUERY_ERROR(code, ...)                                \
    throw hoststat::error::SystemQueryError(                               \
        HOSTSTAT_FILE_NAME, HOSTSTAT_FILE_LINE, HOSTSTAT_FUNC_NAME, code, \
        __VA_ARGS__)

#define THROW_COMMAND_ERROR(status, ...)                                     \
    throw hoststat::error::CommandError(HOSTSTAT_FILE_NAME,                 \
                                        HOSTSTAT_FILE_LINE,                 \
                                        HOSTSTAT_FUNC_NAME, status, __VA_ARGS__)

#endif  // HOSTSTAT_ERROR_EXCEPTION_HPP
