/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-10

Description: Result types returned by the status queries

**************************************************/

#include "types.hpp"

namespace hoststat::status {

auto toJson(const ByteValue& value) -> nlohmann::json {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

auto DiskUsage::toJson() const -> nlohmann::json {
    return {{"total", status::toJson(total)},
            {"used", status::toJson(used)},
            {"free", status::toJson(free)}};
}

auto ProcessInfo::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"cmd", cmd}, {"name", name}};
    if (user && userDomain) {
        j["user"] = *user;
        j["user_domain"] = *userDomain;
    }
    return j;
}

auto toJson(const ProcessTable& table) -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [pid, info] : table) {
        j[std::to_string(pid)] = info.toJson();
    }
    return j;
}

auto toJson(const ProcsResult& result) -> nlohmann::json {
    if (const auto* count = std::get_if<std::size_t>(&result)) {
        return *count;
    }
    return toJson(std::get<ProcessTable>(result));
}

auto toJson(const UptimeValue& value) -> nlohmann::json {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

}  // namespace hoststat::status
