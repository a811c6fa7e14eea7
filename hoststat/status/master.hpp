/*
 * master.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-12

Description: Master connectivity check

**************************************************/

#ifndef HOSTSTAT_STATUS_MASTER_HPP
#define HOSTSTAT_STATUS_MASTER_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "hoststat/config/options.hpp"
#include "hoststat/event/event_bus.hpp"
#include "hoststat/system/command.hpp"
#include "hoststat/system/resolver.hpp"

namespace hoststat::status {

/**
 * @brief Command listing TCP connections with numeric addresses:
 * "netstat -n -p TCP" on Windows, "netstat -n -t" elsewhere.
 */
auto connectionListingCommand() -> std::vector<std::string>;

/**
 * @brief Collects remote hosts of established connections whose remote
 * port equals port.
 *
 * Only lines containing ESTABLISHED are considered. The remote endpoint is
 * the column just before the state column and is split at its last ':'.
 * Lines whose port is not a number are skipped.
 *
 *   Proto  Local Address          Foreign Address        State
 *   TCP    10.1.1.26:3389         10.1.1.1:4505          ESTABLISHED
 */
auto parseEstablishedRemotes(std::string_view output, std::uint16_t port)
    -> std::set<std::string>;

/**
 * @class MasterMonitor
 * @brief Compares the caller's belief about the master connection with the
 * live connection table and fires an event when they disagree.
 *
 * The monitor keeps no state: the caller passes the state it assumed after
 * the previous run.
 */
class MasterMonitor {
public:
    MasterMonitor(const config::Options& options,
                  system::CommandRunner& runner,
                  system::HostResolver& resolver, event::EventSink& events);

    /**
     * @brief Remote hosts currently connected to the given port.
     * @throws error::CommandError if the connection listing fails.
     */
    auto remotesOn(std::uint16_t port) -> std::set<std::string>;

    /**
     * @brief Runs one check.
     *
     * A master that is not given, or does not resolve, is never found in
     * the connection table, so it reads as disconnected.
     *
     * @param master Host name or IPv4 address of the master.
     * @param connected Whether the caller believes the master is connected.
     * @return Tag of the event fired, or std::nullopt when the observation
     * matched the belief.
     * @throws error::CommandError if the connection listing fails; no event
     * is fired in that case.
     */
    auto check(const std::optional<std::string>& master, bool connected = true)
        -> std::optional<std::string>;

private:
    const config::Options& options_;
    system::CommandRunner& runner_;
    system::HostResolver& resolver_;
    event::EventSink& events_;
};

}  // namespace hoststat::status

#endif  // HOSTSTAT_STATUS_MASTER_HPP
