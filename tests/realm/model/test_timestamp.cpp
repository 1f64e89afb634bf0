#include <gtest/gtest.h>

#include "realm/model/timestamp.hpp"

using namespace reaches::realm::model;

class TimestampTest : public ::testing::Test {};

TEST_F(TimestampTest, FormatsUtcWithMilliseconds) {
    EXPECT_EQ(formatIsoTimestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(formatIsoTimestamp(1714557601250), "2024-05-01T10:00:01.250Z");
}

TEST_F(TimestampTest, ParsesWhatItFormats) {
    for (Timestamp value : {Timestamp{0}, Timestamp{1714557601250},
                            Timestamp{1700000000007}}) {
        EXPECT_EQ(parseIsoTimestamp(formatIsoTimestamp(value)), value);
    }
}

TEST_F(TimestampTest, ParsesOffsetsAndMissingZone) {
    EXPECT_EQ(parseIsoTimestamp("2024-05-01T10:00:00"), 1714557600000);
    EXPECT_EQ(parseIsoTimestamp("2024-05-01T12:00:00+02:00"), 1714557600000);
    EXPECT_EQ(parseIsoTimestamp("2024-05-01T10:00:00.5Z"), 1714557600500);
}

TEST_F(TimestampTest, RejectsMalformedText) {
    EXPECT_FALSE(parseIsoTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-05-01T10:00:00Zjunk").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-05-01T10:00:00.Z").has_value());
}

TEST_F(TimestampTest, CurrentTimeIsRecent) {
    EXPECT_GT(currentTimestamp(), 1700000000000);
}
