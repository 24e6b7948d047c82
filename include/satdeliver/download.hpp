/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_DOWNLOAD_HPP
#define __SATDELIVER_DOWNLOAD_HPP

#include <satdeliver/contact.hpp>

#include <chrono>
#include <map>
#include <string_view>
#include <utility>
#include <vector>

namespace satdeliver {

/**
 * Probability that the n-th upcoming download pass is the one used,
 * keyed by the number of passes available.
 */
class DownloadTable {
public:
    DownloadTable() = default;
    explicit DownloadTable(std::map<int, std::vector<double>> weights);

    /**
     * Weights for 1 to 4 candidate passes from the operational analysis.
     */
    static DownloadTable standard();

    /**
     * Weights for n candidates, one per rank. Uses the largest key not
     * above n; ranks beyond that key's list get weight zero. With no
     * usable key every weight is zero.
     */
    std::vector<double> weightsFor(size_t n) const;

    void set(int n, std::vector<double> weights) { weights_[n] = std::move(weights); }
    const std::map<int, std::vector<double>>& entries() const { return weights_; }
    bool empty() const { return weights_.empty(); }

    /**
     * @throws ConfigurationError if a key is below 1, a weight is negative,
     *         or a key's weights sum to more than 1
     */
    void validate() const;

private:
    std::map<int, std::vector<double>> weights_;
};

/**
 * Parse "N:w1,w2,..." into a table entry.
 * @throws std::invalid_argument if the text is malformed
 */
std::pair<int, std::vector<double>> parseDownloadWeights(std::string_view str);

/**
 * Download passes that may carry one image, each with the probability of
 * being the pass used, plus the probability that none of them is.
 */
struct DownloadAssignment {
    std::vector<std::pair<ContactOpportunity, double>> candidates;
    double residual = 1.0;
};

/**
 * Parameters of the download assignment.
 */
struct DownloadPolicy {
    std::chrono::seconds minDelay{std::chrono::hours(1)};
    std::chrono::seconds maxDelay{std::chrono::hours(6)};
    int maxDownloadsConsidered = 2;
};

/**
 * Assign download candidates to an image captured at captureEnd.
 *
 * Candidates are the downloads whose start is after captureEnd + minDelay
 * and before captureEnd + maxDelay, earliest first, at most
 * maxDownloadsConsidered of them.
 *
 * @param downloads The satellite's retained downloads in chronological order
 */
DownloadAssignment assignDownloads(time_point captureEnd,
                                   const std::vector<ContactOpportunity> &downloads,
                                   const DownloadPolicy &policy,
                                   const DownloadTable &table);

}

#endif
