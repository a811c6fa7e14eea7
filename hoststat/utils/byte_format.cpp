/*
 * byte_format.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-2

Description: Human readable byte counts

**************************************************/

#include "byte_format.hpp"

namespace hoststat::utils {

auto formatBytes(std::uint64_t bytes) -> std::string {
    if (bytes < K_KILOBYTE_BOUNDARY) {
        return std::to_string(bytes) + "B";
    }
    if (bytes < K_MEGABYTE_BOUNDARY) {
        return std::to_string(bytes / K_KILOBYTE_BOUNDARY) + "KB";
    }
    if (bytes < K_GIGABYTE_BOUNDARY) {
        return std::to_string(bytes / K_MEGABYTE_BOUNDARY) + "MB";
    }
    if (bytes < K_TERABYTE_BOUNDARY) {
        return std::to_string(bytes / K_GIGABYTE_BOUNDARY) + "GB";
    }
    return std::to_string(bytes / K_TERABYTE_BOUNDARY) + "TB";
}

}  // namespace hoststat::utils
