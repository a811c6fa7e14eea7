/*
 * master.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-12

Description: Master connectivity check

**************************************************/

#include "master.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"
#include "hoststat/utils/string.hpp"

namespace hoststat::status {

namespace {
constexpr std::string_view K_ESTABLISHED = "ESTABLISHED";
}  // namespace

auto connectionListingCommand() -> std::vector<std::string> {
#ifdef _WIN32
    return {"netstat", "-n", "-p", "TCP"};
#else
    return {"netstat", "-n", "-t"};
#endif
}

auto parseEstablishedRemotes(std::string_view output, std::uint16_t port)
    -> std::set<std::string> {
    std::set<std::string> remotes;
    for (const auto& line : utils::splitLines(output)) {
        if (line.find(K_ESTABLISHED) == std::string::npos) {
            continue;
        }

        const auto chunks = utils::splitWhitespace(line);
        auto state = std::find(chunks.begin(), chunks.end(), K_ESTABLISHED);
        if (state == chunks.end() || state == chunks.begin()) {
            continue;
        }

        auto endpoint = utils::rsplitOnce(*(state - 1), ':');
        if (!endpoint) {
            continue;
        }
        auto& [remoteHost, remotePort] = *endpoint;
        auto parsedPort = utils::parseInteger(remotePort);
        if (!parsedPort) {
            spdlog::debug("Skipping connection with bad port: {}", line);
            continue;
        }
        if (*parsedPort != port) {
            continue;
        }
        remotes.insert(std::move(remoteHost));
    }
    return remotes;
}

MasterMonitor::MasterMonitor(const config::Options& options,
                             system::CommandRunner& runner,
                             system::HostResolver& resolver,
                             event::EventSink& events)
    : options_(options),
      runner_(runner),
      resolver_(resolver),
      events_(events) {}

auto MasterMonitor::remotesOn(std::uint16_t port) -> std::set<std::string> {
    std::string output;
    try {
        output = runner_.run(connectionListingCommand());
    } catch (const error::CommandError& e) {
        spdlog::error("Failed netstat: {}", e.getMessage());
        throw;
    }
    return parseEstablishedRemotes(output, port);
}

auto MasterMonitor::check(const std::optional<std::string>& master,
                          bool connected) -> std::optional<std::string> {
    const auto port = options_.publishPort();

    // Connections are listed by address, so a host name has to be
    // resolved first.
    std::optional<std::string> masterIp;
    if (master) {
        masterIp = resolver_.resolve(*master);
        if (!masterIp) {
            spdlog::warn("Master {} did not resolve to an IPv4 address",
                         *master);
        }
    }

    const auto remotes = remotesOn(port);
    const bool found = masterIp && remotes.contains(*masterIp);
    spdlog::debug("Master {} on port {}: {} (assumed {})",
                  master.value_or("<none>"), port,
                  found ? "connected" : "not connected",
                  connected ? "connected" : "disconnected");

    std::string_view tag;
    if (connected && !found) {
        tag = event::K_MASTER_DISCONNECTED;
    } else if (!connected && found) {
        tag = event::K_MASTER_CONNECTED;
    } else {
        return std::nullopt;
    }

    nlohmann::json data = {{"master", nullptr}};
    if (master) {
        data["master"] = *master;
    }
    events_.fireEvent(data, tag);
    return std::string(tag);
}

}  // namespace hoststat::status
