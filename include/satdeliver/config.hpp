/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_CONFIG_HPP
#define __SATDELIVER_CONFIG_HPP

#include <satdeliver/cloud.hpp>
#include <satdeliver/download.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

/**
 * Acquisition probability for satellites whose name contains a fragment.
 */
struct Platform {
    std::string nameFragment;
    double acquisitionProbability;
};

/**
 * Parse "NAME:P" into a platform.
 * @throws std::invalid_argument if the text is malformed
 */
Platform parsePlatform(std::string_view str);

/**
 * Settings for one delivery analysis.
 *
 * Build a Config, call validate(), then pass it by const reference.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    bool hasFinalTime() const;
    time_point getFinalTime() const;
    void setFinalTime(const time_point tp);

    std::chrono::seconds getMaxAge() const;
    void setMaxAge(const std::chrono::seconds age);

    /**
     * Start of the analysis window, finalTime - maxAge.
     */
    time_point getWindowStart() const;

    double getCloudThreshold() const;
    void setCloudThreshold(const double threshold);

    std::chrono::seconds getMinDownloadDelay() const;
    void setMinDownloadDelay(const std::chrono::seconds delay);

    std::chrono::seconds getMaxDownloadDelay() const;
    void setMaxDownloadDelay(const std::chrono::seconds delay);

    int getDownloadFrequency() const;
    void setDownloadFrequency(const int k);

    int getMaxDownloadsConsidered() const;
    void setMaxDownloadsConsidered(const int n);

    const DownloadTable& getDownloadTable() const;
    void setDownloadTable(DownloadTable table);

    std::chrono::seconds getScanStep() const;
    void setScanStep(const std::chrono::seconds step);

    std::chrono::seconds getRefinementTolerance() const;
    void setRefinementTolerance(const std::chrono::seconds tolerance);

    std::chrono::seconds getMaxElementAge() const;
    void setMaxElementAge(const std::chrono::seconds age);

    std::chrono::seconds getProcessingDelay() const;
    void setProcessingDelay(const std::chrono::seconds delay);

    CloudSamplePolicy getCloudSamplePolicy() const;
    void setCloudSamplePolicy(const CloudSamplePolicy policy);

    bool getWeightByClearSky() const;
    void setWeightByClearSky(const bool weight);

    void addPlatform(Platform platform);
    const std::vector<Platform>& getPlatforms() const;

    double getDefaultAcquisitionProbability() const;
    void setDefaultAcquisitionProbability(const double p);

    /**
     * Acquisition probability of the first platform whose fragment appears
     * in the satellite name, or the default.
     */
    double acquisitionProbabilityFor(std::string_view satelliteName) const;

    /**
     * Worker count, 0 meaning one per hardware thread.
     */
    unsigned int getThreads() const;
    void setThreads(const unsigned int threads);

    DownloadPolicy downloadPolicy() const;

    /**
     * @throws ConfigurationError describing the first invalid setting
     */
    void validate() const;

private:
    std::optional<time_point> finalTime;
    std::chrono::seconds maxAge = std::chrono::hours(24);
    double cloudThreshold = 1.0;
    std::chrono::seconds minDownloadDelay = std::chrono::hours(1);
    std::chrono::seconds maxDownloadDelay = std::chrono::hours(6);
    int downloadFrequency = 8;
    int maxDownloadsConsidered = 2;
    DownloadTable downloadTable = DownloadTable::standard();
    std::chrono::seconds scanStep = std::chrono::seconds(30);
    std::chrono::seconds refinementTolerance = std::chrono::seconds(1);
    std::chrono::seconds maxElementAge = std::chrono::days(14);
    std::chrono::seconds processingDelay = std::chrono::seconds(0);
    CloudSamplePolicy cloudSamplePolicy = CloudSamplePolicy::Midpoint;
    bool weightByClearSky = false;
    std::vector<Platform> platforms;
    double defaultAcquisitionProbability = 1.0;
    unsigned int threads = 0;
};

}

#endif
