#include <gtest/gtest.h>

#include "readings-log.hpp"

#include <ctime>

TEST(ReadingsLog, KeepsTenMostRecentFirst) {
    ReadingsLog log;
    for (int i = 1; i <= 11; i++) {
        log.Add("reading " + std::to_string(i));
    }

    auto entries = log.Entries();
    ASSERT_EQ(entries.size(), kReadingsCapacity);
    EXPECT_EQ(entries.front(), "reading 11");
    EXPECT_EQ(entries.back(), "reading 2");
    for (size_t i = 0; i < entries.size(); i++) {
        EXPECT_EQ(entries[i], "reading " + std::to_string(11 - i));
    }
}

TEST(ReadingsLog, NeverExceedsCapacity) {
    ReadingsLog log(3);
    for (int i = 0; i < 50; i++) {
        log.Add("x");
        EXPECT_LE(log.Size(), 3u);
    }
    EXPECT_EQ(log.Capacity(), 3u);
}

TEST(ReadingsLog, ClearEmptiesLog) {
    ReadingsLog log;
    log.Add("a");
    log.Clear();
    EXPECT_TRUE(log.Empty());
}

TEST(ReadingsLog, FormatUsesLocalTime) {
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 5;
    local.tm_hour = 14;
    local.tm_min = 3;
    local.tm_sec = 27;
    local.tm_isdst = -1;
    auto at = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(FormatReading(75, at), "HR: 75bpm - 14:03:27");
}
