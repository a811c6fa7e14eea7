/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-18

Description: Runtime options shared by the status queries

**************************************************/

#ifndef HOSTSTAT_CONFIG_OPTIONS_HPP
#define HOSTSTAT_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hoststat::config {

inline constexpr std::uint16_t K_DEFAULT_PUBLISH_PORT = 4505;
inline constexpr std::string_view K_DEFAULT_DISK_PATH = "c:/";
inline constexpr std::string_view K_DEFAULT_UPTIME_MARKER = "Statistics since";
inline constexpr std::string_view K_DEFAULT_UPTIME_TIME_FORMAT =
    "%d/%m/%Y %H:%M:%S";

/**
 * @class Options
 * @brief JSON-backed key/value configuration.
 *
 * Values come from the built-in defaults, then an optional JSON file, then
 * individual overrides. The store is read-only to the status queries.
 */
class Options {
public:
    Options();

    /**
     * @brief Loads a JSON object from file on top of the defaults.
     * @throws error::InvalidArgument when the file cannot be read or is not
     * a JSON object.
     */
    static auto fromFile(const std::filesystem::path& path) -> Options;

    /**
     * @brief Parses a JSON object on top of the defaults.
     */
    static auto fromJson(std::string_view text) -> Options;

    /// Null when the key is not set.
    [[nodiscard]] auto get(const std::string& key) const -> nlohmann::json;

    void set(const std::string& key, nlohmann::json value);

    /**
     * @brief Sets a key from command-line text. Text that parses as JSON
     * (numbers, booleans, quoted strings) is stored as such; anything else
     * is stored as a plain string.
     */
    void setFromString(const std::string& key, const std::string& text);

    /**
     * @brief The master publish port.
     *
     * An empty string selects the default; numeric strings are accepted.
     * @throws error::InvalidArgument for any other value or a port outside
     * 1..65535.
     */
    [[nodiscard]] auto publishPort() const -> std::uint16_t;

    [[nodiscard]] auto diskPath() const -> std::string;
    [[nodiscard]] auto uptimeMarker() const -> std::string;
    [[nodiscard]] auto uptimeTimeFormat() const -> std::string;
    [[nodiscard]] auto logLevel() const -> std::string;
    [[nodiscard]] auto logFile() const -> std::string;

    [[nodiscard]] auto toJson() const -> const nlohmann::json& { return values_; }

private:
    auto getString(const std::string& key, std::string_view fallback) const
        -> std::string;

    nlohmann::json values_;
};

}  // namespace hoststat::config

#endif  // HOSTSTAT_CONFIG_OPTIONS_HPP
