#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, ParseSchedulerTime) {
    auto a = parse_scheduler_time("2019-03-21T10:00:00");
    auto b = parse_scheduler_time("2019-03-21T10:00:45");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b - *a, 45);
}

TEST(TimeUtils, ParseSchedulerTimeFraction) {
    auto whole = parse_scheduler_time("2019-03-21T10:00:00");
    auto frac = parse_scheduler_time("2019-03-21T10:00:00.123");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(*whole, *frac);
}

TEST(TimeUtils, ParseSchedulerTimeRejects) {
    EXPECT_FALSE(parse_scheduler_time("").has_value());
    EXPECT_FALSE(parse_scheduler_time("not-a-date").has_value());
    EXPECT_FALSE(parse_scheduler_time("2019-03-21").has_value());
    EXPECT_FALSE(parse_scheduler_time("2019-03-21T10:00:00Z").has_value());
    EXPECT_FALSE(parse_scheduler_time("2019-03-21T10:00:00.").has_value());
    EXPECT_FALSE(parse_scheduler_time("03/21/2019 10:00:00").has_value());
}

TEST(TimeUtils, FormatDurationEmpty) {
    EXPECT_EQ(format_duration(""), "-");
}

TEST(TimeUtils, FormatDurationBadParse) {
    EXPECT_EQ(format_duration("not-a-date"), "?");
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T10:00:45"), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T10:05:30"), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    EXPECT_EQ(format_duration("2025-01-15T10:00:00.250", "2025-01-15T12:15:00"), "2h15m");
}
