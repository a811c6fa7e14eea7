#include <gtest/gtest.h>

#include <ctime>

#include "hoststat/utils/time.hpp"

namespace hoststat::utils::test {

namespace {
auto localEpoch(int year, int month, int day, int hour, int minute,
                int second) -> std::time_t {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}
}  // namespace

TEST(ParseLocalTimeTest, DayFirstFormat) {
    auto parsed = parseLocalTime("19/10/2026 08:15:30");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed),
              localEpoch(2026, 10, 19, 8, 15, 30));
}

TEST(ParseLocalTimeTest, SingleDigitFieldsAndSurroundingBlanks) {
    auto parsed = parseLocalTime(" 1/1/2020 00:00:00 ");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed),
              localEpoch(2020, 1, 1, 0, 0, 0));
}

TEST(ParseLocalTimeTest, SingleDigitTimeOfDay) {
    auto parsed = parseLocalTime("3/7/2021 6:5:9");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed),
              localEpoch(2021, 7, 3, 6, 5, 9));
}

TEST(ParseLocalTimeTest, CustomFormat) {
    auto parsed = parseLocalTime("2024-02-29 23:59:59", "%Y-%m-%d %H:%M:%S");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed),
              localEpoch(2024, 2, 29, 23, 59, 59));
}

TEST(ParseLocalTimeTest, RejectsMismatchedText) {
    EXPECT_FALSE(parseLocalTime("").has_value());
    EXPECT_FALSE(parseLocalTime("yesterday").has_value());
    EXPECT_FALSE(parseLocalTime("19/10/2026 08:15:30 AM").has_value());
}

}  // namespace hoststat::utils::test
