/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satdeliver/cloud.hpp>
#include <satdeliver/parse.hpp>

#include <chrono>
#include <stdexcept>

namespace satdeliver {
namespace {

using namespace std::chrono;

TEST(TrimTest, StripsSpacesTabsAndCarriageReturns) {
    EXPECT_EQ(trim("  ISS (ZARYA)\t\r"), "ISS (ZARYA)");
    EXPECT_EQ(trimLeft("  x "), "x ");
    EXPECT_EQ(trimRight(" x \r"), " x");
    EXPECT_EQ(trim(" \t "), "");
}

TEST(ToNumberTest, ParsesWholeField) {
    EXPECT_DOUBLE_EQ(toNumber<double>("51.6312"), 51.6312);
    EXPECT_EQ(toNumber<int>("25544"), 25544);
    EXPECT_THROW(toNumber<int>("25544U"), std::invalid_argument);
    EXPECT_THROW(toNumber<double>(""), std::invalid_argument);
}

TEST(SplitFieldsTest, KeepsEmptyFields) {
    auto fields = splitFields("Paris, 48.8566 ,,30", ',');
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "Paris");
    EXPECT_EQ(fields[1], "48.8566");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "30");
}

TEST(ParseTimestampTest, ParsesUTC) {
    time_point expected = sys_days{year{2025}/December/1} + hours(12) + minutes(30) + seconds(5);
    EXPECT_EQ(parseTimestamp("2025-12-01 12:30:05"), expected);
    EXPECT_EQ(parseTimestamp(" 2025-12-01 12:30:05\r"), expected);
}

TEST(ParseTimestampTest, RejectsMalformedText) {
    EXPECT_THROW(parseTimestamp(""), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("tomorrow"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2025-12-01"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2025-13-01 12:00:00"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2025-12-01T12:00:00Z"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2025-12-01 12:00:00 extra"), std::invalid_argument);
}

TEST(FormatTimestampTest, WholeSecondsInUTC) {
    auto t = parseTimestamp("2025-12-01 12:30:05") + milliseconds(750);
    EXPECT_EQ(formatTimestamp(t), "2025-12-01 12:30:05 UTC");
}

TEST(CloudSamplePolicyTest, ParsesNamesAndRejectsOthers) {
    EXPECT_EQ(parseCloudSamplePolicy("start"), CloudSamplePolicy::Start);
    EXPECT_EQ(parseCloudSamplePolicy("midpoint"), CloudSamplePolicy::Midpoint);
    EXPECT_EQ(parseCloudSamplePolicy("worst"), CloudSamplePolicy::Worst);
    EXPECT_THROW(parseCloudSamplePolicy(""), std::invalid_argument);
    EXPECT_THROW(parseCloudSamplePolicy("median"), std::invalid_argument);
}

}
}
