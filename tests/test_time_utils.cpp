#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

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
    EXPECT_EQ(format_duration("2025-01-15T10:00:00", "2025-01-15T12:15:00"), "2h15m");
}

TEST(TimeUtils, FormatSecondsClampsNegative) {
    EXPECT_EQ(format_seconds(-5), "0s");
    EXPECT_EQ(format_seconds(0), "0s");
    EXPECT_EQ(format_seconds(3725), "1h2m");
}

TEST(TimeUtils, FormatReportTime) {
    EXPECT_EQ(format_report_time(""), "-");
    EXPECT_EQ(format_report_time("garbage"), "?");
    EXPECT_EQ(format_report_time("2025-01-15T14:35:22"), "2025-01-15 14:35:22");
}

TEST(Utils, ParseIntIsStrict) {
    int v = 0;
    EXPECT_TRUE(parse_int(" 42 ", v));
    EXPECT_EQ(v, 42);
    EXPECT_FALSE(parse_int("42s", v));
    EXPECT_FALSE(parse_int("", v));
    EXPECT_FALSE(parse_int("abc", v));
}

TEST(Utils, ParseBool) {
    EXPECT_TRUE(parse_bool("Yes"));
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_FALSE(parse_bool("off", true));
    EXPECT_TRUE(parse_bool("maybe", true));
}

TEST(Utils, SplitList) {
    auto parts = split_list(" mkv, .MP4 ,,avi ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "mkv");
    EXPECT_EQ(parts[1], ".MP4");
    EXPECT_EQ(parts[2], "avi");
}
