#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

#include "common/mock_collaborators.hpp"
#include "hoststat/error/exception.hpp"
#include "hoststat/status/status.hpp"

namespace hoststat::status::test {

using hoststat::test::makeProcess;
using hoststat::test::MockCommandRunner;
using hoststat::test::MockProcessQuery;
using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {
auto localTime(int year, int month, int day, int hour, int minute,
               int second) -> std::chrono::system_clock::time_point {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

const std::string K_NET_STATS_OUTPUT =
    "Server Statistics for \\\\BUILD01\r\n"
    "\r\n"
    "\r\n"
    "Statistics Since 1/1/2020 00:00:00\r\n"
    "\r\n"
    "\r\n"
    "Sessions accepted                  1\r\n"
    "The command completed successfully.\r\n"
    "\r\n";
}  // namespace

TEST(PlatformTest, SupportedOnlyOnWindows) {
#ifdef _WIN32
    EXPECT_TRUE(isSupportedPlatform());
#else
    EXPECT_FALSE(isSupportedPlatform());
#endif
}

TEST(ParseCpuLoadTest, CsvLayout) {
    EXPECT_EQ(parseCpuLoad("Node,CPU,LoadPercentage\r\n,0,37 \r\n"), 37);
    EXPECT_EQ(parseCpuLoad("\r\r\nNode,LoadPercentage\r\r\nBUILD01,4\r\r\n"),
              4);
}

TEST(ParseCpuLoadTest, FixedWidthLayout) {
    const std::string output =
        "DeviceID  LoadPercentage  Name\r\n"
        "CPU0      5               Intel(R) Core(TM) i7\r\n"
        "\r\n";
    EXPECT_EQ(parseCpuLoad(output), 5);
}

TEST(ParseCpuLoadTest, UsesFirstProcessor) {
    const std::string output =
        "DeviceID  LoadPercentage\n"
        "CPU0      12\n"
        "CPU1      80\n";
    EXPECT_EQ(parseCpuLoad(output), 12);
}

TEST(ParseCpuLoadTest, MissingColumnThrows) {
    EXPECT_THROW(parseCpuLoad("DeviceID  Name\r\nCPU0      Intel\r\n"),
                 error::ParseError);
    EXPECT_THROW(parseCpuLoad(""), error::ParseError);
    EXPECT_THROW(parseCpuLoad("DeviceID  LoadPercentage\r\n"),
                 error::ParseError);
}

TEST(ParseCpuLoadTest, LayoutMismatchThrows) {
    EXPECT_THROW(parseCpuLoad("DeviceID  LoadPercentage\r\nCPU0\r\n"),
                 error::ParseError);
    EXPECT_THROW(parseCpuLoad("Node,LoadPercentage\r\nBUILD01,high\r\n"),
                 error::ParseError);
    EXPECT_THROW(parseCpuLoad("Node,CPU,LoadPercentage\r\nBUILD01\r\n"),
                 error::ParseError);
}

TEST(ParseBootTimeTest, FindsMarkerCaseInsensitively) {
    EXPECT_EQ(parseBootTime(K_NET_STATS_OUTPUT, "Statistics since",
                            "%d/%m/%Y %H:%M:%S"),
              localTime(2020, 1, 1, 0, 0, 0));
}

TEST(ParseBootTimeTest, LastMatchingLineWins) {
    const std::string output =
        "Statistics since 1/1/2020 00:00:00\n"
        "Statistics since 2/1/2020 06:30:00\n";
    EXPECT_EQ(parseBootTime(output, "Statistics since", "%d/%m/%Y %H:%M:%S"),
              localTime(2020, 1, 2, 6, 30, 0));
}

TEST(ParseBootTimeTest, LocalizedMarkerAndFormat) {
    const std::string output = "Statistik seit 2024-02-29 23:59:59\r\n";
    EXPECT_EQ(parseBootTime(output, "Statistik seit", "%Y-%m-%d %H:%M:%S"),
              localTime(2024, 2, 29, 23, 59, 59));
}

TEST(ParseBootTimeTest, MissingMarkerThrows) {
    EXPECT_THROW(parseBootTime("Sessions accepted 1\r\n", "Statistics since",
                               "%d/%m/%Y %H:%M:%S"),
                 error::ParseError);
}

TEST(ParseBootTimeTest, UnparsableTimestampThrows) {
    EXPECT_THROW(parseBootTime("Statistics since 1/1/2020 12:00:00 AM\r\n",
                               "Statistics since", "%d/%m/%Y %H:%M:%S"),
                 error::ParseError);
}

TEST(FormatUptimeTest, UnderOneDay) {
    EXPECT_EQ(formatUptime(0), "00:00:00");
    EXPECT_EQ(formatUptime(59), "00:00:59");
    EXPECT_EQ(formatUptime(3723), "01:02:03");
    EXPECT_EQ(formatUptime(86399), "23:59:59");
}

TEST(FormatUptimeTest, Days) {
    EXPECT_EQ(formatUptime(86400), "Days: 1 00:00:00");
    EXPECT_EQ(formatUptime(90123), "Days: 1 01:02:03");
    EXPECT_EQ(formatUptime(364LL * 86400), "Days: 364 00:00:00");
}

TEST(FormatUptimeTest, Years) {
    EXPECT_EQ(formatUptime(365LL * 86400), "Years: 1 Days: 0 00:00:00");
    EXPECT_EQ(formatUptime(400LL * 86400 + 5), "Years: 1 Days: 35 00:00:05");
    EXPECT_EQ(formatUptime(731LL * 86400), "Years: 2 Days: 1 00:00:00");
}

TEST(FormatUptimeTest, NegativeIsZero) {
    EXPECT_EQ(formatUptime(-5), "00:00:00");
}

class StatusModuleTest : public ::testing::Test {
protected:
    config::Options options;
    MockCommandRunner runner;
    MockProcessQuery processQuery;
    StatusModule module{options, runner, processQuery};
};

TEST_F(StatusModuleTest, CpuLoadRunsCpuInfoCommand) {
    EXPECT_CALL(runner, run(ElementsAre("wmic", "cpu")))
        .WillOnce(Return("Node,CPU,LoadPercentage\r\n,0,37 \r\n"));
    EXPECT_EQ(module.cpuLoad(), 37);
}

TEST_F(StatusModuleTest, CpuLoadPropagatesCommandFailure) {
    EXPECT_CALL(runner, run(ElementsAre("wmic", "cpu")))
        .WillOnce(Throw(error::CommandError("wmic", 1, "run", 1, "failed")));
    EXPECT_THROW(module.cpuLoad(), error::CommandError);
}

TEST_F(StatusModuleTest, CpuLoadIsRecomputedOnEveryCall) {
    EXPECT_CALL(runner, run(ElementsAre("wmic", "cpu")))
        .WillOnce(Return("Node,LoadPercentage\r\nBUILD01,10\r\n"))
        .WillOnce(Return("Node,LoadPercentage\r\nBUILD01,90\r\n"));
    EXPECT_EQ(module.cpuLoad(), 10);
    EXPECT_EQ(module.cpuLoad(), 90);
}

TEST_F(StatusModuleTest, UptimeSeconds) {
    EXPECT_CALL(runner, run(ElementsAre("net", "stats", "srv")))
        .WillOnce(Return(K_NET_STATS_OUTPUT));

    const auto now = localTime(2020, 1, 2, 1, 2, 3);
    const auto result = module.uptime(false, now);
    ASSERT_TRUE(std::holds_alternative<double>(result));
    EXPECT_DOUBLE_EQ(std::get<double>(result), 90123.0);
}

TEST_F(StatusModuleTest, UptimeHumanReadable) {
    EXPECT_CALL(runner, run(ElementsAre("net", "stats", "srv")))
        .Times(2)
        .WillRepeatedly(Return(K_NET_STATS_OUTPUT));

    EXPECT_EQ(std::get<std::string>(
                  module.uptime(true, localTime(2020, 1, 1, 1, 2, 3))),
              "01:02:03");
    EXPECT_EQ(std::get<std::string>(
                  module.uptime(true, localTime(2020, 1, 2, 1, 2, 3))),
              "Days: 1 01:02:03");
}

TEST_F(StatusModuleTest, UptimeUsesConfiguredMarker) {
    options.set("uptime_marker", "Statistik seit");
    options.set("uptime_time_format", "%Y-%m-%d %H:%M:%S");
    EXPECT_CALL(runner, run(ElementsAre("net", "stats", "srv")))
        .WillOnce(Return("Statistik seit 2020-01-01 00:00:00\r\n"));

    const auto result = module.uptime(false, localTime(2020, 1, 1, 0, 1, 0));
    EXPECT_DOUBLE_EQ(std::get<double>(result), 60.0);
}

TEST_F(StatusModuleTest, UptimeWithoutMarkerThrows) {
    EXPECT_CALL(runner, run(ElementsAre("net", "stats", "srv")))
        .WillOnce(Return("The command completed successfully.\r\n"));
    EXPECT_THROW(module.uptime(false), error::ParseError);
}

TEST_F(StatusModuleTest, DiskUsageRawBytes) {
    const auto path = std::filesystem::temp_directory_path().string();
    const auto usage = module.diskUsage(false, path);

    const auto total = std::get<std::uint64_t>(usage.total);
    const auto used = std::get<std::uint64_t>(usage.used);
    const auto free = std::get<std::uint64_t>(usage.free);
    EXPECT_GT(total, 0U);
    EXPECT_EQ(total, used + free);
}

TEST_F(StatusModuleTest, DiskUsageDefaultsToConfiguredPath) {
    options.set("disk_path", std::filesystem::temp_directory_path().string());
    const auto usage = module.diskUsage();
    EXPECT_GT(std::get<std::uint64_t>(usage.total), 0U);
}

TEST_F(StatusModuleTest, DiskUsageHumanReadable) {
    const auto path = std::filesystem::temp_directory_path().string();
    const auto json = module.diskUsage(true, path).toJson();

    for (const auto* key : {"total", "used", "free"}) {
        ASSERT_TRUE(json[key].is_string()) << key;
        EXPECT_THAT(json[key].get<std::string>(), EndsWith("B")) << key;
    }
}

TEST_F(StatusModuleTest, DiskUsageInvalidPathThrows) {
    const auto missing =
        (std::filesystem::temp_directory_path() / "hoststat_missing" / "x")
            .string();
    EXPECT_THROW(module.diskUsage(false, missing), error::SystemQueryError);
}

TEST_F(StatusModuleTest, ProcessCount) {
    EXPECT_CALL(processQuery, processes()).WillOnce(Invoke([] {
        std::vector<std::unique_ptr<system::ProcessHandle>> list;
        list.push_back(makeProcess(0, "System Idle Process", std::nullopt,
                                   {"", system::K_OWNER_ACCESS_DENIED, ""}));
        list.push_back(makeProcess(4, "System", std::nullopt,
                                   {"", system::K_OWNER_ACCESS_DENIED, ""}));
        list.push_back(makeProcess(1234, "cmd.exe", "cmd.exe /k",
                                   {"WORK", 0, "bob"}));
        return list;
    }));

    const auto result = module.procs(true);
    ASSERT_TRUE(std::holds_alternative<std::size_t>(result));
    EXPECT_EQ(std::get<std::size_t>(result), 3U);
    EXPECT_EQ(toJson(result), 3);
}

TEST_F(StatusModuleTest, ProcessTable) {
    EXPECT_CALL(processQuery, processes()).WillOnce(Invoke([] {
        std::vector<std::unique_ptr<system::ProcessHandle>> list;
        list.push_back(makeProcess(4, "System", std::nullopt,
                                   {"", system::K_OWNER_ACCESS_DENIED, ""}));
        list.push_back(makeProcess(1234, "cmd.exe", "cmd.exe /k",
                                   {"WORK", 0, "bob"}));
        list.push_back(makeProcess(2222, "svchost.exe", std::nullopt,
                                   {"", system::K_OWNER_ACCESS_DENIED, ""}));
        return list;
    }));

    const auto json = toJson(module.procs(false));
    ASSERT_EQ(json.size(), 3U);
    EXPECT_EQ(json["4"]["user"], "SYSTEM");
    EXPECT_EQ(json["4"]["user_domain"], "NT AUTHORITY");
    EXPECT_EQ(json["1234"]["cmd"], "cmd.exe /k");
    EXPECT_EQ(json["1234"]["user"], "bob");
    EXPECT_EQ(json["2222"]["cmd"], "");
    EXPECT_EQ(json["2222"]["name"], "svchost.exe");
    EXPECT_FALSE(json["2222"].contains("user"));
}

TEST_F(StatusModuleTest, ProcessQueryFailurePropagates) {
    EXPECT_CALL(processQuery, processes())
        .WillOnce(Throw(error::SystemQueryError("wmi", 1, "processes", 5L,
                                                "access denied")));
    EXPECT_THROW(module.procs(true), error::SystemQueryError);
}

TEST_F(StatusModuleTest, AgentMemory) {
    EXPECT_CALL(processQuery, workingSet(system::currentProcessId()))
        .Times(2)
        .WillRepeatedly(Return(2097152));

    EXPECT_EQ(std::get<std::uint64_t>(module.agentMemory(false)), 2097152U);
    EXPECT_EQ(std::get<std::string>(module.agentMemory(true)), "2MB");
}

}  // namespace hoststat::status::test
