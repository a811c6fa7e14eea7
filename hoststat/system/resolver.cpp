/*
 * resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Host name to IPv4 address resolution

**************************************************/

#include "resolver.hpp"

#include <array>

#ifdef _WIN32
// clang-format off
#include <winsock2.h>
#include <ws2tcpip.h>
// clang-format on
#ifdef _MSC_VER
#pragma comment(lib, "ws2_32.lib")
#endif
#else
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"

namespace hoststat::system {

SystemHostResolver::SystemHostResolver() {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        THROW_RUNTIME_ERROR("WSAStartup failed");
    }
    winsockStarted_ = true;
#endif
}

SystemHostResolver::~SystemHostResolver() {
#ifdef _WIN32
    if (winsockStarted_) {
        WSACleanup();
    }
#endif
}

auto SystemHostResolver::resolve(const std::string& name)
    -> std::optional<std::string> {
    struct addrinfo hints{};
    struct addrinfo* res = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int ret = getaddrinfo(name.c_str(), nullptr, &hints, &res);
    if (ret != 0 || res == nullptr) {
        spdlog::debug("DNS resolution failed for {}: {}", name,
                      gai_strerror(ret));
        return std::nullopt;
    }

    std::array<char, INET_ADDRSTRLEN> ipStr{};
    const auto* addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    const char* converted =
        inet_ntop(AF_INET, &addr->sin_addr, ipStr.data(), ipStr.size());
    freeaddrinfo(res);
    if (converted == nullptr) {
        return std::nullopt;
    }
    return std::string(ipStr.data());
}

}  // namespace hoststat::system
