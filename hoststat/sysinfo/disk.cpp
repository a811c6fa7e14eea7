/*
 * disk.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-2-21

Description: System Information Module - Disk

**************************************************/

#include "disk.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/statvfs.h>
#include <cerrno>
#include <cstring>
#endif

#include <spdlog/spdlog.h>

#include "hoststat/error/exception.hpp"

namespace hoststat::sysinfo {

#ifdef _WIN32
namespace {
auto toWide(const std::string& text) -> std::wstring {
    if (text.empty()) {
        return {};
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, text.data(),
                                   static_cast<int>(text.size()), nullptr, 0);
    std::wstring result(static_cast<std::size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                        result.data(), size);
    return result;
}
}  // namespace
#endif

auto queryDiskSpace(const std::string& path) -> DiskSpace {
    spdlog::debug("Querying disk space for {}", path);
    DiskSpace space;

#ifdef _WIN32
    ULARGE_INTEGER freeBytesAvailable;
    ULARGE_INTEGER totalNumberOfBytes;
    ULARGE_INTEGER totalNumberOfFreeBytes;
    const std::wstring widePath = toWide(path);
    if (GetDiskFreeSpaceExW(widePath.c_str(), &freeBytesAvailable,
                            &totalNumberOfBytes,
                            &totalNumberOfFreeBytes) == 0) {
        const DWORD code = GetLastError();
        THROW_SYSTEM_QUERY_ERROR(static_cast<long>(code),
                                 "GetDiskFreeSpaceEx failed for ", path,
                                 ", error ", code);
    }
    space.total = totalNumberOfBytes.QuadPart;
    space.free = totalNumberOfFreeBytes.QuadPart;
#else
    struct statvfs stat{};
    if (statvfs(path.c_str(), &stat) != 0) {
        const int code = errno;
        THROW_SYSTEM_QUERY_ERROR(code, "statvfs failed for ", path, ": ",
                                 std::strerror(code));
    }
    space.total = static_cast<std::uint64_t>(stat.f_blocks) * stat.f_frsize;
    space.free = static_cast<std::uint64_t>(stat.f_bfree) * stat.f_frsize;
#endif

    return space;
}

}  // namespace hoststat::sysinfo
