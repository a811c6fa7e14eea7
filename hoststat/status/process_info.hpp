/*
 * process_info.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-11

Description: Per-process details and owner fallback

**************************************************/

#ifndef HOSTSTAT_STATUS_PROCESS_INFO_HPP
#define HOSTSTAT_STATUS_PROCESS_INFO_HPP

#include <cstdint>

#include "hoststat/status/types.hpp"
#include "hoststat/system/process_query.hpp"

namespace hoststat::status {

/// Pids of the System Idle Process and the System process.
inline constexpr std::uint32_t K_IDLE_PROCESS_PID = 0;
inline constexpr std::uint32_t K_SYSTEM_PROCESS_PID = 4;

/**
 * @brief Extracts command line, name and owner from a process handle.
 *
 * Owner lookup failures never escape. The System Idle Process and the
 * System process answer access denied and are reported as
 * NT AUTHORITY\SYSTEM; any other failure is logged as a warning and leaves
 * the owner fields empty.
 */
auto getProcessInfo(system::ProcessHandle& process) -> ProcessInfo;

}  // namespace hoststat::status

#endif  // HOSTSTAT_STATUS_PROCESS_INFO_HPP
