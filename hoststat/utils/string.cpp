/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-4-5

Description: String helpers for parsing command output

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace hoststat::utils {

auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string> {
    if (str.empty()) {
        return {};
    }

    std::vector<std::string> tokens;
    tokens.reserve(std::ranges::count(str, delimiter) + 1);

    std::size_t start = 0;
    while (true) {
        const auto pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(str.substr(start));
            break;
        }
        tokens.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

auto splitLines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (auto& line : splitString(text, '\n')) {
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    // A terminating newline does not start another line.
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

auto splitWhitespace(std::string_view str) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < str.size()) {
        while (i < str.size() &&
               std::isspace(static_cast<unsigned char>(str[i])) != 0) {
            ++i;
        }
        const auto start = i;
        while (i < str.size() &&
               std::isspace(static_cast<unsigned char>(str[i])) == 0) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(str.substr(start, i - start));
        }
    }
    return tokens;
}

auto rsplitOnce(std::string_view str, char delimiter)
    -> std::optional<std::pair<std::string, std::string>> {
    const auto pos = str.rfind(delimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(str.substr(0, pos)),
                          std::string(str.substr(pos + 1)));
}

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    const auto first = line.find_first_not_of(symbols);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = line.find_last_not_of(symbols);
    return std::string(line.substr(first, last - first + 1));
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto findIgnoreCase(std::string_view haystack,
                    std::string_view needle) -> std::size_t {
    return toLower(haystack).find(toLower(needle));
}

auto parseInteger(std::string_view str) -> std::optional<long long> {
    if (str.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    const auto* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace hoststat::utils
