#include <gtest/gtest.h>
#include <core/time_utils.hpp>

using std::chrono::milliseconds;

TEST(TimeUtils, FormatElapsedMilliseconds) {
    EXPECT_EQ(format_elapsed(milliseconds(850)), "850ms");
}

TEST(TimeUtils, FormatElapsedZero) {
    EXPECT_EQ(format_elapsed(milliseconds(0)), "0ms");
}

TEST(TimeUtils, FormatElapsedNegativeClamps) {
    EXPECT_EQ(format_elapsed(milliseconds(-20)), "0ms");
}

TEST(TimeUtils, FormatElapsedSeconds) {
    EXPECT_EQ(format_elapsed(milliseconds(2400)), "2.4s");
}

TEST(TimeUtils, FormatElapsedMinutes) {
    // 1 minute 5 seconds
    EXPECT_EQ(format_elapsed(milliseconds(65000)), "1m05s");
}

TEST(TimeUtils, FormatElapsedHours) {
    // 2 hours 15 minutes
    EXPECT_EQ(format_elapsed(milliseconds((2 * 3600 + 15 * 60) * 1000LL)), "2h15m");
}
