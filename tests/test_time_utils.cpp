#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using std::chrono::milliseconds;

TEST(TimeUtils, FormatDurationSubSecond) {
    EXPECT_EQ(format_duration(milliseconds(850)), "850ms");
}

TEST(TimeUtils, FormatDurationZero) {
    EXPECT_EQ(format_duration(milliseconds(0)), "0ms");
}

TEST(TimeUtils, FormatDurationNegativeClampsToZero) {
    EXPECT_EQ(format_duration(milliseconds(-40)), "0ms");
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(milliseconds(45'900)), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    // 5 minutes 30 seconds
    EXPECT_EQ(format_duration(milliseconds(330'000)), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    // 2 hours 15 minutes
    EXPECT_EQ(format_duration(milliseconds(8'100'000)), "2h15m");
}
