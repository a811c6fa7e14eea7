#include <gtest/gtest.h>

#include <filesystem>

#include "hoststat/error/exception.hpp"
#include "hoststat/sysinfo/disk.hpp"

namespace hoststat::sysinfo::test {

TEST(DiskSpaceTest, TempDirectoryVolume) {
    const auto path = std::filesystem::temp_directory_path().string();
    const auto space = queryDiskSpace(path);
    EXPECT_GT(space.total, 0U);
    EXPECT_LE(space.free, space.total);
}

TEST(DiskSpaceTest, RepeatedQueriesSeeTheSameVolume) {
    const auto path = std::filesystem::temp_directory_path().string();
    EXPECT_EQ(queryDiskSpace(path).total, queryDiskSpace(path).total);
}

TEST(DiskSpaceTest, MissingPathThrows) {
    const auto missing =
        (std::filesystem::temp_directory_path() / "hoststat_no_such_dir" /
         "nested")
            .string();
    try {
        static_cast<void>(queryDiskSpace(missing));
        FAIL() << "query on a missing path succeeded";
    } catch (const error::SystemQueryError& e) {
        EXPECT_NE(e.code(), 0);
    }
}

}  // namespace hoststat::sysinfo::test
