/*
 * process_info.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-11

Description: Per-process details and owner fallback

**************************************************/

#include "process_info.hpp"

#include <exception>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace hoststat::status {

namespace {
void applyOwner(system::ProcessHandle& process, ProcessInfo& info) {
    std::optional<system::OwnerLookup> owner;
    try {
        owner = process.getOwner();
    } catch (const std::exception& e) {
        spdlog::debug("GetOwner raised for PID={}: {}", process.pid(),
                      e.what());
    }

    if (owner && owner->errorCode == 0 && !owner->user.empty() &&
        !owner->domain.empty()) {
        info.user = owner->user;
        info.userDomain = owner->domain;
        return;
    }

    const auto pid = process.pid();
    if ((pid == K_IDLE_PROCESS_PID || pid == K_SYSTEM_PROCESS_PID) && owner &&
        owner->errorCode == system::K_OWNER_ACCESS_DENIED) {
        info.user = "SYSTEM";
        info.userDomain = "NT AUTHORITY";
        return;
    }

    spdlog::warn("Error getting owner of process; PID='{}'; Error: {}", pid,
                 owner ? std::to_string(owner->errorCode) : "None");
}
}  // namespace

auto getProcessInfo(system::ProcessHandle& process) -> ProcessInfo {
    ProcessInfo info;
    info.cmd = process.commandLine().value_or("");
    info.name = process.name();
    applyOwner(process, info);
    return info;
}

}  // namespace hoststat::status
