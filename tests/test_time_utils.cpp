#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using std::chrono::seconds;

static std::time_t local_time(int year, int mon, int day, int hour, int min) {
    struct tm tm_buf = {};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = mon - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_isdst = -1;
    return std::mktime(&tm_buf);
}

TEST(TimeUtils, FormatElapsedSeconds) {
    EXPECT_EQ(format_elapsed(seconds(45)), "45s");
}

TEST(TimeUtils, FormatElapsedMinutes) {
    EXPECT_EQ(format_elapsed(seconds(5 * 60 + 30)), "5m30s");
}

TEST(TimeUtils, FormatElapsedHours) {
    EXPECT_EQ(format_elapsed(seconds(2 * 3600 + 15 * 60 + 10)), "2h15m");
}

TEST(TimeUtils, FormatElapsedZeroAndNegative) {
    EXPECT_EQ(format_elapsed(seconds(0)), "0s");
    EXPECT_EQ(format_elapsed(seconds(-5)), "0s");
}

TEST(TimeUtils, FormatClockAfternoon) {
    EXPECT_EQ(format_clock(local_time(2025, 1, 15, 14, 35)), "2:35pm");
}

TEST(TimeUtils, FormatClockMidnight) {
    EXPECT_EQ(format_clock(local_time(2025, 1, 15, 0, 0)), "12:00am");
}

TEST(TimeUtils, FormatEpochUnknown) {
    EXPECT_EQ(format_epoch(0), "-");
}

TEST(TimeUtils, FormatEpochLocal) {
    EXPECT_EQ(format_epoch(local_time(2024, 3, 9, 8, 5)), "2024-03-09 08:05");
}
