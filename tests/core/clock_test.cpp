#include "hsync/core/clock.hpp"
#include "hsync/core/id.hpp"

#include <gtest/gtest.h>

#include <set>

using hsync::core::ManualClock;
using hsync::core::Timestamp;
using hsync::core::parse_iso8601;
using hsync::core::to_iso8601;

TEST(ClockTest, RendersUtcWithMilliseconds) {
    ManualClock clock;
    EXPECT_EQ(to_iso8601(clock.now()), "2023-11-14T22:13:20.000Z");

    clock.advance(std::chrono::milliseconds(1234));
    EXPECT_EQ(to_iso8601(clock.now()), "2023-11-14T22:13:21.234Z");
}

TEST(ClockTest, ParsesOwnOutput) {
    ManualClock clock;
    clock.advance(std::chrono::hours(24 * 40) + std::chrono::milliseconds(7));

    auto parsed = parse_iso8601(to_iso8601(clock.now()));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), clock.now());
}

TEST(ClockTest, FoldsOffsetsIntoUtc) {
    auto zulu = parse_iso8601("2024-03-01T12:00:00Z");
    auto plus = parse_iso8601("2024-03-01T14:00:00+02:00");
    auto minus = parse_iso8601("2024-03-01T07:30:00-04:30");
    auto bare = parse_iso8601("2024-03-01T12:00:00");

    ASSERT_TRUE(zulu.is_ok());
    ASSERT_TRUE(plus.is_ok());
    ASSERT_TRUE(minus.is_ok());
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(plus.value(), zulu.value());
    EXPECT_EQ(minus.value(), zulu.value());
    EXPECT_EQ(bare.value(), zulu.value());
}

TEST(ClockTest, TruncatesLongFractions) {
    auto parsed = parse_iso8601("2024-03-01T12:00:00.123456Z");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(to_iso8601(parsed.value()), "2024-03-01T12:00:00.123Z");
}

TEST(ClockTest, RejectsMalformedTimestamps) {
    for (const char* text : {"", "yesterday", "2024-13-01T00:00:00Z", "2024-03-01 12:00", "2024-03-01T12:00:00.Z",
                             "2024-03-01T12:00:00+2", "2024-03-01T12:00:00Zjunk"}) {
        auto parsed = parse_iso8601(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error().kind, hsync::ErrorKind::Validation) << text;
    }
}

TEST(IdTest, GeneratesDistinctIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(hsync::core::generate_id());
    }
    EXPECT_EQ(ids.size(), 1000u);
}
