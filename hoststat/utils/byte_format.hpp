/*
 * byte_format.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-2

Description: Human readable byte counts

**************************************************/

#ifndef HOSTSTAT_UTILS_BYTE_FORMAT_HPP
#define HOSTSTAT_UTILS_BYTE_FORMAT_HPP

#include <cstdint>
#include <string>

namespace hoststat::utils {

inline constexpr std::uint64_t K_KILOBYTE_BOUNDARY = 1024ULL;
// 1014 * 1024, not 1024 * 1024. MB values are divided by this same constant.
inline constexpr std::uint64_t K_MEGABYTE_BOUNDARY = 1038336ULL;
inline constexpr std::uint64_t K_GIGABYTE_BOUNDARY = 1073741824ULL;
inline constexpr std::uint64_t K_TERABYTE_BOUNDARY = 1099511627776ULL;

/**
 * @brief Formats a byte count with a single unit suffix.
 *
 * Values below each boundary use the previous unit; the quotient is
 * truncated toward zero, e.g. 1536 -> "1KB".
 *
 * @param bytes The raw byte count.
 * @return The count followed by one of B, KB, MB, GB or TB.
 */
[[nodiscard]] auto formatBytes(std::uint64_t bytes) -> std::string;

}  // namespace hoststat::utils

#endif  // HOSTSTAT_UTILS_BYTE_FORMAT_HPP
