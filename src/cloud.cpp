/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/cloud.hpp>
#include <satdeliver/parse.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satdeliver {

std::string_view toString(CloudSamplePolicy policy) {
    switch (policy) {
        case CloudSamplePolicy::Start: return "start";
        case CloudSamplePolicy::Midpoint: return "midpoint";
        case CloudSamplePolicy::Worst: return "worst";
    }
    return "unknown";
}

CloudSamplePolicy parseCloudSamplePolicy(std::string_view str) {
    if (str == "start") return CloudSamplePolicy::Start;
    if (str == "midpoint") return CloudSamplePolicy::Midpoint;
    if (str == "worst") return CloudSamplePolicy::Worst;
    throw std::invalid_argument("Invalid cloud sample policy: " + std::string(str));
}

void CloudSeries::set(time_point t, double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("Cloud fraction out of range [0, 1]: " + std::to_string(fraction));
    }
    samples_[hourOf(t)] = fraction;
}

const double* CloudSeries::find(time_point t) const {
    auto it = samples_.find(hourOf(t));
    return it == samples_.end() ? nullptr : &it->second;
}

CloudSeries loadCloudSeries(std::istream &s) {
    CloudSeries series;
    std::string line;
    bool headerSeen = false;
    int lineNumber = 0;

    while (std::getline(s, line)) {
        lineNumber++;
        std::string_view lineView = trim(line);
        if (lineView.empty()) continue;

        if (!headerSeen) {
            headerSeen = true;
            continue;
        }

        auto fields = splitFields(lineView, ',');
        if (fields.size() != 2) {
            throw std::invalid_argument("Line " + std::to_string(lineNumber)
                                        + ": expected timestamp,cloud_fraction but got: "
                                        + std::string(lineView));
        }
        series.set(parseTimestamp(fields[0]), toNumber<double>(fields[1]));
    }

    debug("Loaded {} hourly cloud samples", series.size());
    return series;
}

CloudSeries loadCloudSeries(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open weather file: " + filepath);
    }
    return loadCloudSeries(file);
}

}
