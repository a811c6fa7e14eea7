/*
 * disk.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-2-21

Description: System Information Module - Disk

**************************************************/

#ifndef HOSTSTAT_SYSINFO_DISK_HPP
#define HOSTSTAT_SYSINFO_DISK_HPP

#include <cstdint>
#include <string>

namespace hoststat::sysinfo {

/**
 * @struct DiskSpace
 * @brief Capacity of the volume holding a path, in bytes.
 */
struct DiskSpace {
    std::uint64_t total = 0;  ///< Size of the volume
    std::uint64_t free = 0;   ///< Free space on the volume, quotas ignored
};

/**
 * @brief Queries the capacity of the volume that holds path.
 *
 * Uses GetDiskFreeSpaceExW on Windows and statvfs elsewhere.
 *
 * @throws error::SystemQueryError carrying the OS error code when the path
 * is invalid or the query fails.
 */
auto queryDiskSpace(const std::string& path) -> DiskSpace;

}  // namespace hoststat::sysinfo

#endif  // HOSTSTAT_SYSINFO_DISK_HPP
