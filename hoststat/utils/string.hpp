/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-4-5

Description: String helpers for parsing command output

**************************************************/

#ifndef HOSTSTAT_UTILS_STRING_HPP
#define HOSTSTAT_UTILS_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hoststat::utils {

/**
 * @brief Splits a string on a single delimiter, keeping empty fields.
 *
 * @param str The input string.
 * @param delimiter The delimiter.
 * @return The fields in order.
 */
[[nodiscard("the result of splitString is not used")]]
auto splitString(std::string_view str,
                 char delimiter) -> std::vector<std::string>;

/**
 * @brief Splits text into lines. Both "\n" and "\r\n" end a line and any
 * carriage returns left at the end of a line are dropped, so the doubled
 * "\r\r\n" endings wmic produces come out clean.
 */
[[nodiscard("the result of splitLines is not used")]]
auto splitLines(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Splits on runs of whitespace, dropping empty tokens.
 */
[[nodiscard("the result of splitWhitespace is not used")]]
auto splitWhitespace(std::string_view str) -> std::vector<std::string>;

/**
 * @brief Splits at the last occurrence of the delimiter.
 *
 * @return The parts before and after the delimiter, or std::nullopt when the
 * delimiter does not occur.
 */
[[nodiscard]]
auto rsplitOnce(std::string_view str, char delimiter)
    -> std::optional<std::pair<std::string, std::string>>;

/**
 * @brief Trims a string_view.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return The trimmed string.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line,
          std::string_view symbols = " \n\r\t") -> std::string;

auto toLower(std::string_view str) -> std::string;

/**
 * @brief Case-insensitive substring search.
 * @return Offset of the first match in haystack, or std::string::npos.
 */
[[nodiscard]] auto findIgnoreCase(std::string_view haystack,
                                  std::string_view needle) -> std::size_t;

/**
 * @brief Parses the whole of str as a base 10 integer.
 * @return The value, or std::nullopt when str is empty, has trailing
 * characters or does not fit.
 */
[[nodiscard]] auto parseInteger(std::string_view str)
    -> std::optional<long long>;

}  // namespace hoststat::utils

#endif  // HOSTSTAT_UTILS_STRING_HPP
