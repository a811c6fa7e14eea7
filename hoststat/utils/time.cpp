/*
 * time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-10-27

Description: Some useful functions about time

**************************************************/

#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include "hoststat/utils/string.hpp"

namespace hoststat::utils {

namespace {
// std::get_time wants two digits for %d, %m, %H, %M and %S; "net stats"
// prints 1/1/2020.
auto padSingleDigits(std::string_view text) -> std::string {
    std::string padded;
    padded.reserve(text.size() + 8);
    std::size_t i = 0;
    while (i < text.size()) {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            padded += text[i++];
            continue;
        }
        const auto start = i;
        while (i < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
        if (i - start == 1) {
            padded += '0';
        }
        padded.append(text.substr(start, i - start));
    }
    return padded;
}
}  // namespace

auto parseLocalTime(std::string_view timestampStr, std::string_view format)
    -> std::optional<std::chrono::system_clock::time_point> {
    const std::string trimmed = trim(timestampStr);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::tm timeStruct = {};
    std::istringstream inputStream(padSingleDigits(trimmed));
    inputStream >> std::get_time(&timeStruct, std::string(format).c_str());
    if (inputStream.fail()) {
        return std::nullopt;
    }
    // Anything left over means the format did not cover the whole input.
    inputStream >> std::ws;
    if (!inputStream.eof()) {
        return std::nullopt;
    }

    timeStruct.tm_isdst = -1;
    const std::time_t epoch = std::mktime(&timeStruct);
    if (epoch == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(epoch);
}

}  // namespace hoststat::utils
