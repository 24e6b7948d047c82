/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/aggregator.hpp>

#include <algorithm>

namespace satdeliver {

double imageFailureProbability(const ImageOpportunity &image,
                               const DownloadAssignment &assignment,
                               const DeliveryPolicy &policy) {
    double acquisition = image.contact.acquisitionProbability;
    if (policy.weightByClearSky) {
        acquisition *= 1.0 - image.cloudFraction;
    }

    double delivered = 0.0;
    for (const auto &[download, weight] : assignment.candidates) {
        if (download.start + policy.processingDelay <= policy.finalTime) {
            delivered += weight;
        }
    }

    return std::clamp(1.0 - acquisition * delivered, 0.0, 1.0);
}

double deliveryProbability(const std::vector<double> &failures) {
    double failure = 1.0;
    for (double f : failures) {
        failure *= f;
    }
    return 1.0 - failure;
}

}
