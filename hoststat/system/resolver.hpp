/*
 * resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Host name to IPv4 address resolution

**************************************************/

#ifndef HOSTSTAT_SYSTEM_RESOLVER_HPP
#define HOSTSTAT_SYSTEM_RESOLVER_HPP

#include <optional>
#include <string>

namespace hoststat::system {

class HostResolver {
public:
    virtual ~HostResolver() = default;

    /**
     * @brief Resolves a host name or dotted IPv4 literal.
     * @return The first IPv4 address in dotted form, or std::nullopt when
     * the name does not resolve.
     */
    virtual auto resolve(const std::string& name)
        -> std::optional<std::string> = 0;
};

/**
 * @brief Resolver using getaddrinfo restricted to AF_INET.
 */
class SystemHostResolver : public HostResolver {
public:
    SystemHostResolver();
    ~SystemHostResolver() override;

    SystemHostResolver(const SystemHostResolver&) = delete;
    SystemHostResolver& operator=(const SystemHostResolver&) = delete;

    auto resolve(const std::string& name)
        -> std::optional<std::string> override;

private:
    bool winsockStarted_ = false;
};

}  // namespace hoststat::system

#endif
