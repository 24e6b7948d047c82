/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_AGGREGATOR_HPP
#define __SATDELIVER_AGGREGATOR_HPP

#include <satdeliver/download.hpp>
#include <satdeliver/feasibility.hpp>

#include <chrono>
#include <vector>

namespace satdeliver {

/**
 * Settings that turn an assignment into a failure probability.
 */
struct DeliveryPolicy {
    time_point finalTime;
    std::chrono::seconds processingDelay{0};
    bool weightByClearSky = false;
};

/**
 * Probability that an image does not reach the end user by the deadline:
 *
 *   1 - acquisition * sum(weight * [download start + processing delay <= deadline])
 *
 * With weightByClearSky the acquisition probability is scaled by the clear
 * fraction of the sky. The assignment residual never counts as success.
 */
double imageFailureProbability(const ImageOpportunity &image,
                               const DownloadAssignment &assignment,
                               const DeliveryPolicy &policy);

/**
 * Combine independent per-image failures for one location. No images
 * means no delivery.
 */
double deliveryProbability(const std::vector<double> &failures);

}

#endif
