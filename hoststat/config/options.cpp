/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-18

Description: Runtime options shared by the status queries

**************************************************/

#include "options.hpp"

#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"
#include "hoststat/utils/string.hpp"

namespace hoststat::config {

Options::Options()
    : values_({{"publish_port", K_DEFAULT_PUBLISH_PORT},
               {"disk_path", std::string(K_DEFAULT_DISK_PATH)},
               {"uptime_marker", std::string(K_DEFAULT_UPTIME_MARKER)},
               {"uptime_time_format",
                std::string(K_DEFAULT_UPTIME_TIME_FORMAT)},
               {"log_level", "info"},
               {"log_file", ""}}) {}

auto Options::fromFile(const std::filesystem::path& path) -> Options {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_INVALID_ARGUMENT("Cannot open config file: ", path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    spdlog::debug("Loaded config file {}", path.string());
    return fromJson(text);
}

auto Options::fromJson(std::string_view text) -> Options {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        THROW_INVALID_ARGUMENT("Config must be a JSON object");
    }

    Options options;
    for (auto& [key, value] : parsed.items()) {
        options.values_[key] = value;
    }
    return options;
}

auto Options::get(const std::string& key) const -> nlohmann::json {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return nullptr;
    }
    return *it;
}

void Options::set(const std::string& key, nlohmann::json value) {
    values_[key] = std::move(value);
}

void Options::setFromString(const std::string& key, const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || parsed.is_structured()) {
        set(key, text);
    } else {
        set(key, std::move(parsed));
    }
}

auto Options::publishPort() const -> std::uint16_t {
    const auto value = get("publish_port");

    long long port = K_DEFAULT_PUBLISH_PORT;
    if (value.is_number_integer()) {
        port = value.get<long long>();
    } else if (value.is_string()) {
        const auto text = utils::trim(value.get<std::string>());
        if (text.empty()) {
            return K_DEFAULT_PUBLISH_PORT;
        }
        auto parsed = utils::parseInteger(text);
        if (!parsed) {
            THROW_INVALID_ARGUMENT("publish_port is not a number: ", text);
        }
        port = *parsed;
    } else if (!value.is_null()) {
        THROW_INVALID_ARGUMENT("publish_port has unsupported type ",
                               value.type_name());
    }

    if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
        THROW_INVALID_ARGUMENT("publish_port out of range: ", port);
    }
    return static_cast<std::uint16_t>(port);
}

auto Options::getString(const std::string& key,
                        std::string_view fallback) const -> std::string {
    const auto value = get(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return std::string(fallback);
}

auto Options::diskPath() const -> std::string {
    auto path = getString("disk_path", K_DEFAULT_DISK_PATH);
    return path.empty() ? std::string(K_DEFAULT_DISK_PATH) : path;
}

auto Options::uptimeMarker() const -> std::string {
    return getString("uptime_marker", K_DEFAULT_UPTIME_MARKER);
}

auto Options::uptimeTimeFormat() const -> std::string {
    return getString("uptime_time_format", K_DEFAULT_UPTIME_TIME_FORMAT);
}

auto Options::logLevel() const -> std::string {
    return getString("log_level", "info");
}

auto Options::logFile() const -> std::string {
    return getString("log_file", "");
}

}  // namespace hoststat::config
