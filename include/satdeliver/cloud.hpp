/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_CLOUD_HPP
#define __SATDELIVER_CLOUD_HPP

#include <chrono>
#include <istream>
#include <map>
#include <string>
#include <string_view>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

/**
 * Which hourly sample represents an interval that may span several hours.
 */
enum class CloudSamplePolicy {
    Start,      ///< Hour containing the interval start
    Midpoint,   ///< Hour containing the interval midpoint
    Worst       ///< Largest fraction over every hour the interval touches
};

std::string_view toString(CloudSamplePolicy policy);

/**
 * @throws std::invalid_argument for anything but "start", "midpoint" or "worst"
 */
CloudSamplePolicy parseCloudSamplePolicy(std::string_view str);

/**
 * Hourly cloud-fraction series for one location.
 */
class CloudSeries {
public:
    CloudSeries() = default;

    /**
     * Record the fraction for the hour containing t. A later value for the
     * same hour replaces the earlier one.
     *
     * @throws std::invalid_argument if fraction is outside [0, 1]
     */
    void set(time_point t, double fraction);

    /**
     * Fraction for the hour containing t, or nullptr if there is no sample.
     */
    const double* find(time_point t) const;

    bool empty() const { return samples_.empty(); }
    size_t size() const { return samples_.size(); }

    static time_point hourOf(time_point t) {
        return std::chrono::floor<std::chrono::hours>(t);
    }

private:
    std::map<time_point, double> samples_;
};

/**
 * Read a "timestamp,cloud_fraction" CSV with a header row. Timestamps use
 * "%Y-%m-%d %H:%M:%S" in UTC.
 *
 * @throws std::invalid_argument for malformed rows
 */
CloudSeries loadCloudSeries(std::istream &s);

/**
 * @throws std::runtime_error if the file cannot be opened
 */
CloudSeries loadCloudSeries(const std::string &filepath);

}

#endif
