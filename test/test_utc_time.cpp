// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "knet_reader/core/UtcTime.hpp"

using namespace knet_reader;

TEST(UtcTimeTest, CivilRoundTripAroundEpoch) {
    EXPECT_EQ(0, daysFromCivil(1970, 1, 1));
    EXPECT_EQ(-1, daysFromCivil(1969, 12, 31));
    EXPECT_EQ(11016, daysFromCivil(2000, 2, 29));

    int y = 0, m = 0, d = 0;
    civilFromDays(11016, y, m, d);
    EXPECT_EQ(2000, y);
    EXPECT_EQ(2, m);
    EXPECT_EQ(29, d);
}

TEST(UtcTimeTest, ParsesKnetTimestamp) {
    const auto civil = parseCalendarTimestamp("2011/03/11 14:46:45");
    ASSERT_TRUE(civil.has_value());
    EXPECT_EQ(2011, civil->year);
    EXPECT_EQ(3, civil->month);
    EXPECT_EQ(11, civil->day);
    EXPECT_EQ(14, civil->hour);
    EXPECT_EQ(46, civil->minute);
    EXPECT_EQ(45, civil->second);
}

TEST(UtcTimeTest, AcceptsSingleDigitFields) {
    const auto civil = parseCalendarTimestamp("2012/1/2 3:4:5");
    ASSERT_TRUE(civil.has_value());
    EXPECT_EQ(1, civil->month);
    EXPECT_EQ(2, civil->day);
    EXPECT_EQ(3, civil->hour);
    EXPECT_EQ(4, civil->minute);
    EXPECT_EQ(5, civil->second);
}

TEST(UtcTimeTest, RejectsMalformedTimestamps) {
    EXPECT_FALSE(parseCalendarTimestamp("").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011-03-11 14:46:45").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("11/03/11 14:46:45").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/03/11 14:46").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/03/11 14:46:45 ").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/13/11 14:46:45").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/02/29 00:00:00").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/03/11 24:00:00").has_value());
    EXPECT_FALSE(parseCalendarTimestamp("2011/03/11 14:46:60").has_value());
    EXPECT_TRUE(parseCalendarTimestamp("2012/02/29 00:00:00").has_value());
}

TEST(UtcTimeTest, RecordTimeToUtcRemovesDelayAndOffset) {
    const auto civil = parseCalendarTimestamp("2011/03/11 14:46:45");
    ASSERT_TRUE(civil.has_value());
    const UtcTime start = jstToUtc(removeTriggerDelay(toUtcTime(*civil)));
    EXPECT_EQ("2011-03-11T05:46:30Z", formatIso8601(start));
}

TEST(UtcTimeTest, JstConversionCrossesMidnight) {
    const auto civil = parseCalendarTimestamp("2012/01/01 08:59:59");
    ASSERT_TRUE(civil.has_value());
    EXPECT_EQ("2011-12-31T23:59:59Z", formatIso8601(jstToUtc(toUtcTime(*civil))));
}

TEST(UtcTimeTest, FormatsMillisecondsOnlyWhenPresent) {
    EXPECT_EQ("1970-01-01T00:00:00Z", formatIso8601(fromEpochMilliseconds(0)));
    EXPECT_EQ("1970-01-01T00:00:01.250Z", formatIso8601(fromEpochMilliseconds(1250)));
    EXPECT_EQ("1969-12-31T23:59:59.999Z", formatIso8601(fromEpochMilliseconds(-1)));
}

TEST(UtcTimeTest, CivilTimeRoundTrip) {
    CivilTime civil;
    civil.year = 2024;
    civil.month = 12;
    civil.day = 31;
    civil.hour = 23;
    civil.minute = 59;
    civil.second = 58;
    civil.millisecond = 7;

    const CivilTime back = toCivilTime(toUtcTime(civil));
    EXPECT_EQ(civil.year, back.year);
    EXPECT_EQ(civil.month, back.month);
    EXPECT_EQ(civil.day, back.day);
    EXPECT_EQ(civil.hour, back.hour);
    EXPECT_EQ(civil.minute, back.minute);
    EXPECT_EQ(civil.second, back.second);
    EXPECT_EQ(civil.millisecond, back.millisecond);
}
