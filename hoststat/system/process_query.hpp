/*
 * process_query.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-3

Description: Structured process queries

**************************************************/

#ifndef HOSTSTAT_SYSTEM_PROCESS_QUERY_HPP
#define HOSTSTAT_SYSTEM_PROCESS_QUERY_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hoststat::system {

/**
 * @struct OwnerLookup
 * @brief Result of asking the OS who owns a process.
 *
 * errorCode follows Win32_Process.GetOwner: 0 on success, 2 for access
 * denied, 3 for insufficient privilege, 8 for unknown failure, 9 for path
 * not found.
 */
struct OwnerLookup {
    std::string domain;
    int errorCode = 0;
    std::string user;
};

inline constexpr int K_OWNER_ACCESS_DENIED = 2;

/**
 * @class ProcessHandle
 * @brief One row of the process enumeration.
 */
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    [[nodiscard]] virtual auto pid() const -> std::uint32_t = 0;
    [[nodiscard]] virtual auto name() const -> std::string = 0;
    /// std::nullopt when the OS reports no command line.
    [[nodiscard]] virtual auto commandLine() const
        -> std::optional<std::string> = 0;
    /// May throw when the lookup itself cannot be issued.
    virtual auto getOwner() -> OwnerLookup = 0;
};

/**
 * @class ProcessQuery
 * @brief Structured process queries; the WMI classes Win32_Process and
 * Win32_PerfRawData_PerfProc_Process on Windows.
 *
 * Every call opens and closes its own session; nothing is held between
 * calls. Failures raise error::SystemQueryError.
 */
class ProcessQuery {
public:
    virtual ~ProcessQuery() = default;

    virtual auto processes() -> std::vector<std::unique_ptr<ProcessHandle>> = 0;

    /**
     * @brief Working set size, in bytes, of the given process.
     */
    virtual auto workingSet(std::uint32_t pid) -> std::uint64_t = 0;
};

/**
 * @brief Pid of the calling process.
 */
[[nodiscard]] auto currentProcessId() -> std::uint32_t;

}  // namespace hoststat::system

#endif  // HOSTSTAT_SYSTEM_PROCESS_QUERY_HPP
