/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/feasibility.hpp>
#include <satdeliver/errors.hpp>
#include <satdeliver/parse.hpp>

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satdeliver {

namespace {

double sampleAt(const CloudSeries &clouds, const std::string &targetName, time_point t) {
    const double *fraction = clouds.find(t);
    if (fraction == nullptr) {
        auto hour = CloudSeries::hourOf(t);
        throw MissingWeatherDataError(targetName, hour,
            "No cloud fraction for " + targetName + " at " + formatTimestamp(hour));
    }
    return *fraction;
}

}

double cloudFractionFor(const CloudSeries &clouds,
                        const std::string &targetName,
                        time_point start,
                        time_point end,
                        CloudSamplePolicy policy) {
    switch (policy) {
        case CloudSamplePolicy::Start:
            return sampleAt(clouds, targetName, start);
        case CloudSamplePolicy::Midpoint:
            return sampleAt(clouds, targetName, start + (end - start) / 2);
        case CloudSamplePolicy::Worst: {
            // Hours touched by [start, end), so an image ending on the hour stops before it
            double worst = 0.0;
            for (auto hour = CloudSeries::hourOf(start); hour < end; hour += std::chrono::hours(1)) {
                worst = std::max(worst, sampleAt(clouds, targetName, hour));
            }
            return worst;
        }
    }
    return sampleAt(clouds, targetName, start + (end - start) / 2);
}

std::optional<ImageOpportunity> filterImage(const ContactOpportunity &contact,
                                            const CloudSeries &clouds,
                                            double cloudThreshold,
                                            CloudSamplePolicy policy) {
    double fraction = cloudFractionFor(clouds, contact.groundPoint, contact.start, contact.end, policy);
    if (fraction > cloudThreshold) {
        debug("Image of {} by {} at {} rejected: cloud fraction {} > {}",
              contact.groundPoint, contact.noradID, formatTimestamp(contact.start),
              fraction, cloudThreshold);
        return std::nullopt;
    }
    return ImageOpportunity{contact, fraction};
}

}
