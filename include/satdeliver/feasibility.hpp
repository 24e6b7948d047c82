/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_FEASIBILITY_HPP
#define __SATDELIVER_FEASIBILITY_HPP

#include <satdeliver/cloud.hpp>
#include <satdeliver/contact.hpp>

#include <optional>
#include <string>

namespace satdeliver {

/**
 * An image opportunity that passed the cloud filter, with the cloud
 * fraction it was judged on.
 */
struct ImageOpportunity {
    ContactOpportunity contact;
    double cloudFraction;
};

/**
 * Cloud fraction that applies to the interval [start, end].
 *
 * @throws MissingWeatherDataError if a required hour has no sample
 */
double cloudFractionFor(const CloudSeries &clouds,
                        const std::string &targetName,
                        time_point start,
                        time_point end,
                        CloudSamplePolicy policy);

/**
 * Look up the cloud fraction for an image opportunity and keep it only if
 * the fraction does not exceed the threshold.
 *
 * @return The admissible image, or no value if it is too cloudy
 * @throws MissingWeatherDataError if a required hour has no sample
 */
std::optional<ImageOpportunity> filterImage(const ContactOpportunity &contact,
                                            const CloudSeries &clouds,
                                            double cloudThreshold,
                                            CloudSamplePolicy policy);

}

#endif
