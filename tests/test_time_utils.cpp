#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>

TEST(TimeUtils, IsoRoundTrip) {
    TimePoint t = make_utc(2025, 1, 15, 14, 35, 22);
    EXPECT_EQ(to_iso_utc(t), "2025-01-15T14:35:22Z");
    auto back = parse_iso_utc("2025-01-15T14:35:22Z");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, t);
}

TEST(TimeUtils, IsoEmptyIsEpoch) {
    EXPECT_EQ(to_iso_utc(TimePoint{}), "");
    auto t = parse_iso_utc("");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, TimePoint{});
}

TEST(TimeUtils, IsoBadParse) {
    EXPECT_FALSE(parse_iso_utc("not-a-date").has_value());
}

TEST(TimeUtils, MonthKey) {
    EXPECT_EQ(month_key(make_utc(2025, 3, 31, 23, 59, 59)), "2025-03");
    EXPECT_EQ(month_key(make_utc(2025, 4, 1)), "2025-04");
}

TEST(TimeUtils, StartOfNextMonthWrapsYear) {
    EXPECT_EQ(start_of_next_month(make_utc(2025, 12, 14, 8)), make_utc(2026, 1, 1));
    EXPECT_EQ(start_of_next_month(make_utc(2025, 2, 1)), make_utc(2025, 3, 1));
}

TEST(TimeUtils, StartOfDayAndMinute) {
    TimePoint t = make_utc(2025, 6, 10, 13, 45, 10);
    EXPECT_EQ(start_of_day(t), make_utc(2025, 6, 10));
    EXPECT_EQ(minute_of_day(t), 13 * 60 + 45);
}

TEST(TimeUtils, FormatDurationSeconds) {
    EXPECT_EQ(format_duration(std::chrono::seconds(45)), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    // 5 minutes 30 seconds
    EXPECT_EQ(format_duration(std::chrono::seconds(330)), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    // 2 hours 15 minutes
    EXPECT_EQ(format_duration(std::chrono::seconds(8100)), "2h15m");
}

TEST(TimeUtils, FormatDurationZeroAndNegative) {
    EXPECT_EQ(format_duration(std::chrono::seconds(0)), "0s");
    EXPECT_EQ(format_duration(std::chrono::seconds(-5)), "0s");
}

TEST(TimeUtils, FormatEta) {
    TimePoint now = make_utc(2025, 1, 1, 12);
    EXPECT_EQ(format_eta(now, now), "now");
    EXPECT_EQ(format_eta(now + std::chrono::minutes(90), now), "in 1h30m");
}

TEST(TimeUtils, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(format_bytes(64ULL * 1024 * 1024), "64.0 MiB");
}

TEST(Utils, ParseByteSize) {
    uint64_t v = 0;
    ASSERT_TRUE(parse_byte_size("4096", v));
    EXPECT_EQ(v, 4096u);
    ASSERT_TRUE(parse_byte_size("64M", v));
    EXPECT_EQ(v, 64ULL * 1024 * 1024);
    ASSERT_TRUE(parse_byte_size("1 GiB", v));
    EXPECT_EQ(v, 1024ULL * 1024 * 1024);
    ASSERT_TRUE(parse_byte_size("2tb", v));
    EXPECT_EQ(v, 2ULL * 1024 * 1024 * 1024 * 1024);
    EXPECT_FALSE(parse_byte_size("", v));
    EXPECT_FALSE(parse_byte_size("lots", v));
    EXPECT_FALSE(parse_byte_size("12X", v));
}

TEST(Utils, EscapeKeyRoundTrip) {
    std::string key = "backups/2025/photos 01.tar";
    std::string escaped = escape_key(key);
    EXPECT_EQ(escaped.find('/'), std::string::npos);
    EXPECT_EQ(escaped.find(' '), std::string::npos);
    EXPECT_EQ(unescape_key(escaped), key);
}
