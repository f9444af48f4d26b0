#include "core/utils/Timestamp.hpp"
#include <gtest/gtest.h>

using namespace core::utils;

TEST(TimestampTest, ZuluTimeIsShiftedToDisplayOffset) {
    auto parsed = parseIsoTimestamp("2025-10-15T08:30:00.000Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->hasZone);
    EXPECT_EQ(formatDisplayDateTime(*parsed, 60), "15/10/2025 09:30");
    EXPECT_EQ(formatDisplayDateTime(*parsed, 0), "15/10/2025 08:30");
}

TEST(TimestampTest, ExplicitOffsetIsHonoured) {
    auto parsed = parseIsoTimestamp("2025-10-15T23:45:00+02:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->zoneOffsetMinutes, 120);
    EXPECT_EQ(formatDisplayDateTime(*parsed, 60), "15/10/2025 22:45");
}

TEST(TimestampTest, ShiftCrossesMidnightAndYear) {
    auto parsed = parseIsoTimestamp("2024-12-31T23:30:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatDisplayDateTime(*parsed, 60), "01/01/2025 00:30");
}

TEST(TimestampTest, UnzonedTimeIsPrintedAsWritten) {
    auto parsed = parseIsoTimestamp("2025-03-01 07:05");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->hasZone);
    EXPECT_EQ(formatDisplayDateTime(*parsed, 60), "01/03/2025 07:05");
}

TEST(TimestampTest, DateOnlyIsMidnight) {
    auto parsed = parseIsoTimestamp("2025-02-28");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatDisplayDateTime(*parsed, 60), "28/02/2025 00:00");
}

TEST(TimestampTest, RejectsMalformedInput) {
    EXPECT_FALSE(parseIsoTimestamp("").has_value());
    EXPECT_FALSE(parseIsoTimestamp("hier").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2025-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2025-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2025-10-15T25:00:00Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2025-10-15T08:30:00Zjunk").has_value());
    EXPECT_TRUE(parseIsoTimestamp("2024-02-29T00:00:00Z").has_value());
}

TEST(TimestampTest, CurrentTimestampRoundTrips) {
    const std::string now = currentIsoTimestamp();
    ASSERT_EQ(now.size(), 24u);
    EXPECT_EQ(now.back(), 'Z');
    EXPECT_TRUE(parseIsoTimestamp(now).has_value());
}
