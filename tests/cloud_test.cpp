/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satdeliver/cloud.hpp>
#include <satdeliver/parse.hpp>

#include <chrono>
#include <sstream>

namespace satdeliver {
namespace {

using namespace std::chrono;

TEST(CloudSeriesTest, LooksUpByHour) {
    CloudSeries series;
    series.set(parseTimestamp("2025-12-01 10:00:00"), 0.25);

    const double *fraction = series.find(parseTimestamp("2025-12-01 10:59:59"));
    ASSERT_NE(fraction, nullptr);
    EXPECT_DOUBLE_EQ(*fraction, 0.25);

    EXPECT_EQ(series.find(parseTimestamp("2025-12-01 11:00:00")), nullptr);
    EXPECT_EQ(series.find(parseTimestamp("2025-12-01 09:59:59")), nullptr);
}

TEST(CloudSeriesTest, TimestampsInsideAnHourShareASample) {
    CloudSeries series;
    series.set(parseTimestamp("2025-12-01 10:30:00"), 0.4);
    ASSERT_NE(series.find(parseTimestamp("2025-12-01 10:00:00")), nullptr);
    EXPECT_EQ(series.size(), 1u);
}

TEST(CloudSeriesTest, LaterValueReplacesEarlier) {
    CloudSeries series;
    series.set(parseTimestamp("2025-12-01 10:00:00"), 0.2);
    series.set(parseTimestamp("2025-12-01 10:15:00"), 0.7);
    EXPECT_EQ(series.size(), 1u);
    EXPECT_DOUBLE_EQ(*series.find(parseTimestamp("2025-12-01 10:00:00")), 0.7);
}

TEST(CloudSeriesTest, AcceptsBoundaryFractions) {
    CloudSeries series;
    EXPECT_NO_THROW(series.set(parseTimestamp("2025-12-01 10:00:00"), 0.0));
    EXPECT_NO_THROW(series.set(parseTimestamp("2025-12-01 11:00:00"), 1.0));
}

TEST(CloudSeriesTest, RejectsFractionsOutOfRange) {
    CloudSeries series;
    EXPECT_THROW(series.set(parseTimestamp("2025-12-01 10:00:00"), -0.01), std::invalid_argument);
    EXPECT_THROW(series.set(parseTimestamp("2025-12-01 10:00:00"), 1.01), std::invalid_argument);
    EXPECT_TRUE(series.empty());
}

TEST(CloudSeriesTest, HourOfTruncates) {
    auto t = parseTimestamp("2025-12-01 10:42:17");
    EXPECT_EQ(CloudSeries::hourOf(t), parseTimestamp("2025-12-01 10:00:00"));
}

TEST(CloudSamplePolicyTest, ParsesNames) {
    EXPECT_EQ(parseCloudSamplePolicy("start"), CloudSamplePolicy::Start);
    EXPECT_EQ(parseCloudSamplePolicy("midpoint"), CloudSamplePolicy::Midpoint);
    EXPECT_EQ(parseCloudSamplePolicy("worst"), CloudSamplePolicy::Worst);
    EXPECT_EQ(toString(CloudSamplePolicy::Worst), "worst");
    EXPECT_THROW(parseCloudSamplePolicy("average"), std::invalid_argument);
}

TEST(LoadCloudSeriesTest, ReadsRowsAfterHeader) {
    std::stringstream ss;
    ss << "timestamp,cloud_fraction\n"
       << "2025-12-01 00:00:00,0.10\n"
       << "\n"
       << "2025-12-01 01:00:00, 0.55 \r\n"
       << "2025-12-01 02:00:00,1\n";

    auto series = loadCloudSeries(ss);
    EXPECT_EQ(series.size(), 3u);
    EXPECT_DOUBLE_EQ(*series.find(parseTimestamp("2025-12-01 01:30:00")), 0.55);
    EXPECT_DOUBLE_EQ(*series.find(parseTimestamp("2025-12-01 02:00:00")), 1.0);
}

TEST(LoadCloudSeriesTest, HeaderOnlyIsEmpty) {
    std::stringstream ss("timestamp,cloud_fraction\n");
    EXPECT_TRUE(loadCloudSeries(ss).empty());
}

TEST(LoadCloudSeriesTest, RejectsWrongFieldCount) {
    std::stringstream ss;
    ss << "timestamp,cloud_fraction\n"
       << "2025-12-01 00:00:00,0.10,extra\n";
    EXPECT_THROW(loadCloudSeries(ss), std::invalid_argument);
}

TEST(LoadCloudSeriesTest, RejectsBadValues) {
    std::stringstream badTime("timestamp,cloud_fraction\nyesterday,0.1\n");
    EXPECT_THROW(loadCloudSeries(badTime), std::invalid_argument);

    std::stringstream badFraction("timestamp,cloud_fraction\n2025-12-01 00:00:00,cloudy\n");
    EXPECT_THROW(loadCloudSeries(badFraction), std::invalid_argument);

    std::stringstream outOfRange("timestamp,cloud_fraction\n2025-12-01 00:00:00,1.5\n");
    EXPECT_THROW(loadCloudSeries(outOfRange), std::invalid_argument);
}

TEST(LoadCloudSeriesTest, MissingFileThrows) {
    EXPECT_THROW(loadCloudSeries(std::string("/nonexistent/weather.csv")), std::runtime_error);
}

}
}
