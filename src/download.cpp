/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/download.hpp>
#include <satdeliver/errors.hpp>
#include <satdeliver/parse.hpp>

#include <algorithm>
#include <format>
#include <numeric>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satdeliver {

constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;

DownloadTable::DownloadTable(std::map<int, std::vector<double>> weights)
    : weights_(std::move(weights)) {}

DownloadTable DownloadTable::standard() {
    return DownloadTable({
        {1, {1.0}},
        {2, {0.75, 0.25}},
        {3, {0.6, 0.3, 0.1}},
        {4, {0.5, 0.25, 0.1, 0.05}}
    });
}

std::vector<double> DownloadTable::weightsFor(size_t n) const {
    std::vector<double> result(n, 0.0);
    if (n == 0) {
        return result;
    }

    // Largest key <= n
    auto it = weights_.upper_bound(static_cast<int>(n));
    if (it == weights_.begin()) {
        return result;
    }
    --it;

    const auto &weights = it->second;
    std::copy_n(weights.begin(), std::min(n, weights.size()), result.begin());
    return result;
}

void DownloadTable::validate() const {
    for (const auto &[n, weights] : weights_) {
        if (n < 1) {
            throw ConfigurationError(std::format("Download table key {} must be at least 1", n));
        }
        for (double w : weights) {
            if (!(w >= 0.0)) {
                throw ConfigurationError(std::format("Download table weight {} for {} passes is negative", w, n));
            }
        }
        double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
        if (sum > 1.0 + WEIGHT_SUM_TOLERANCE) {
            throw ConfigurationError(std::format("Download table weights for {} passes sum to {} > 1", n, sum));
        }
    }
}

std::pair<int, std::vector<double>> parseDownloadWeights(std::string_view str) {
    auto colon = str.find(':');
    if (colon == std::string_view::npos) {
        throw std::invalid_argument("Invalid download weights, expected N:w1,w2,...: " + std::string(str));
    }

    int n = toNumber<int>(trim(str.substr(0, colon)));
    std::vector<double> weights;
    for (auto field : splitFields(str.substr(colon + 1), ',')) {
        weights.push_back(toNumber<double>(field));
    }
    return {n, weights};
}

DownloadAssignment assignDownloads(time_point captureEnd,
                                   const std::vector<ContactOpportunity> &downloads,
                                   const DownloadPolicy &policy,
                                   const DownloadTable &table) {
    time_point earliest = captureEnd + policy.minDelay;
    time_point latest = captureEnd + policy.maxDelay;

    // First download starting strictly after the earliest usable time
    auto it = std::upper_bound(downloads.begin(), downloads.end(), earliest,
        [](time_point t, const ContactOpportunity &d) { return t < d.start; });

    std::vector<ContactOpportunity> selected;
    for (; it != downloads.end() && it->start < latest; ++it) {
        if (selected.size() >= static_cast<size_t>(policy.maxDownloadsConsidered)) {
            break;
        }
        selected.push_back(*it);
    }

    auto weights = table.weightsFor(selected.size());

    DownloadAssignment assignment;
    assignment.candidates.reserve(selected.size());
    double total = 0.0;
    for (size_t i = 0; i < selected.size(); i++) {
        total += weights[i];
        assignment.candidates.emplace_back(std::move(selected[i]), weights[i]);
    }
    assignment.residual = std::max(0.0, 1.0 - total);

    debug("Capture ending {}: {} download candidates, residual {}",
          formatTimestamp(captureEnd), assignment.candidates.size(), assignment.residual);
    return assignment;
}

}
