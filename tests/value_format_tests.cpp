#include "core/sysinfo/value_format.hpp"

#include <gtest/gtest.h>

#include "core/i18n/i18n.hpp"
#include "test_languages.hpp"

using namespace verinfo::sysinfo;
using namespace std::chrono;

TEST(ParseCimDateTimeTest, UtcTimestamp) {
    auto parsed = parseCimDateTime("20240115083000.000000+000");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sys_days{2024y / January / 15} + 8h + 30min);
}

TEST(ParseCimDateTimeTest, PositiveOffsetIsSubtracted) {
    auto parsed = parseCimDateTime("20240115083000.500000+060");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sys_days{2024y / January / 15} + 7h + 30min);
}

TEST(ParseCimDateTimeTest, NegativeOffsetIsAdded) {
    auto parsed = parseCimDateTime("20231231230000.000000-300");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sys_days{2024y / January / 1} + 4h);
}

TEST(ParseCimDateTimeTest, RejectsMalformedText) {
    EXPECT_FALSE(parseCimDateTime("").has_value());
    EXPECT_FALSE(parseCimDateTime("no data").has_value());
    EXPECT_FALSE(parseCimDateTime("20240115083000.000000").has_value());
    EXPECT_FALSE(parseCimDateTime("2024011508300a.000000+000").has_value());
    EXPECT_FALSE(parseCimDateTime("20241315083000.000000+000").has_value());
    EXPECT_FALSE(parseCimDateTime("20240115253000.000000+000").has_value());
}

TEST(SplitUptimeTest, SplitsIntoDaysHoursMinutes) {
    auto parts = splitUptime(days{2} + hours{3} + minutes{4} + seconds{59});

    EXPECT_EQ(parts.days, 2);
    EXPECT_EQ(parts.hours, 3);
    EXPECT_EQ(parts.minutes, 4);
}

TEST(SplitUptimeTest, NegativeIsZero) {
    auto parts = splitUptime(seconds{-10});

    EXPECT_EQ(parts.days, 0);
    EXPECT_EQ(parts.hours, 0);
    EXPECT_EQ(parts.minutes, 0);
}

TEST(FormatUptimeTest, UsesLocalizedPattern) {
    verinfo::test::TempDirectory dir("uptime");
    dir.writeTable("en-US", {{"HardwareInfo_UptimeString", "{0} days, {1} hours, {2} minutes"}});
    ASSERT_TRUE(verinfo::i18n::init(dir.path(), "en-US", "en-US").has_value());

    sys_seconds boot{sys_days{2024y / March / 1}};
    auto now = boot + days{1} + hours{2} + minutes{3};

    EXPECT_EQ(formatUptime(boot, now), "1 days, 2 hours, 3 minutes");
}

TEST(FormatBytesTest, SmallValuesInBytes) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
}

TEST(FormatBytesTest, BinaryUnits) {
    EXPECT_EQ(formatBytes(1024), "1.0 KB");
    EXPECT_EQ(formatBytes(1536ull * 1024), "1.5 MB");
    EXPECT_EQ(formatBytes(17'179'869'184ull), "16.0 GB");
    EXPECT_EQ(formatBytes(2ull << 40), "2.0 TB");
}

TEST(FormatUnixDateTest, FormatsUtc) {
    EXPECT_EQ(formatUnixDate(0), "1970-01-01 00:00:00");
    EXPECT_EQ(formatUnixDate(1'700'000'000), "2023-11-14 22:13:20");
}

TEST(ValueFormatTest, NoDataConstant) {
    EXPECT_EQ(kNoData, "no data");
}
