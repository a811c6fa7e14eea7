/*
 * time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-10-27

Description: Some useful functions about time

**************************************************/

#ifndef HOSTSTAT_UTILS_TIME_HPP
#define HOSTSTAT_UTILS_TIME_HPP

#include <chrono>
#include <optional>
#include <string_view>

namespace hoststat::utils {

/**
 * @brief Parses a local wall-clock timestamp.
 *
 * The whole input, apart from surrounding whitespace, must match the
 * strftime-style format. Numeric fields may be written with one digit
 * ("1/1/2020 6:05:00"). Daylight saving is resolved by the C library.
 *
 * @param timestampStr The timestamp text, e.g. "19/10/2026 08:15:00".
 * @param format The expected format (default: "%d/%m/%Y %H:%M:%S")
 * @return The point in time, or std::nullopt when the text does not match.
 */
[[nodiscard]] auto parseLocalTime(std::string_view timestampStr,
                                  std::string_view format = "%d/%m/%Y %H:%M:%S")
    -> std::optional<std::chrono::system_clock::time_point>;

}  // namespace hoststat::utils

#endif  // HOSTSTAT_UTILS_TIME_HPP
