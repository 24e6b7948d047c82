/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/config.hpp>
#include <satdeliver/errors.hpp>
#include <satdeliver/parse.hpp>

#include <format>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satdeliver {

Platform parsePlatform(std::string_view str) {
    auto colon = str.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        throw std::invalid_argument("Invalid platform, expected NAME:P: " + std::string(str));
    }
    return {
        std::string(trim(str.substr(0, colon))),
        toNumber<double>(trim(str.substr(colon + 1)))
    };
}

bool Config::hasFinalTime() const {
    return finalTime.has_value();
}

time_point Config::getFinalTime() const {
    if (!finalTime) {
        throw ConfigurationError("Final time is not set");
    }
    return *finalTime;
}

void Config::setFinalTime(const time_point tp) {
    finalTime = tp;
}

std::chrono::seconds Config::getMaxAge() const {
    return maxAge;
}

void Config::setMaxAge(const std::chrono::seconds age) {
    maxAge = age;
}

time_point Config::getWindowStart() const {
    return getFinalTime() - maxAge;
}

double Config::getCloudThreshold() const {
    return cloudThreshold;
}

void Config::setCloudThreshold(const double threshold) {
    cloudThreshold = threshold;
}

std::chrono::seconds Config::getMinDownloadDelay() const {
    return minDownloadDelay;
}

void Config::setMinDownloadDelay(const std::chrono::seconds delay) {
    minDownloadDelay = delay;
}

std::chrono::seconds Config::getMaxDownloadDelay() const {
    return maxDownloadDelay;
}

void Config::setMaxDownloadDelay(const std::chrono::seconds delay) {
    maxDownloadDelay = delay;
}

int Config::getDownloadFrequency() const {
    return downloadFrequency;
}

void Config::setDownloadFrequency(const int k) {
    downloadFrequency = k;
}

int Config::getMaxDownloadsConsidered() const {
    return maxDownloadsConsidered;
}

void Config::setMaxDownloadsConsidered(const int n) {
    maxDownloadsConsidered = n;
}

const DownloadTable& Config::getDownloadTable() const {
    return downloadTable;
}

void Config::setDownloadTable(DownloadTable table) {
    downloadTable = std::move(table);
}

std::chrono::seconds Config::getScanStep() const {
    return scanStep;
}

void Config::setScanStep(const std::chrono::seconds step) {
    scanStep = step;
}

std::chrono::seconds Config::getRefinementTolerance() const {
    return refinementTolerance;
}

void Config::setRefinementTolerance(const std::chrono::seconds tolerance) {
    refinementTolerance = tolerance;
}

std::chrono::seconds Config::getMaxElementAge() const {
    return maxElementAge;
}

void Config::setMaxElementAge(const std::chrono::seconds age) {
    maxElementAge = age;
}

std::chrono::seconds Config::getProcessingDelay() const {
    return processingDelay;
}

void Config::setProcessingDelay(const std::chrono::seconds delay) {
    processingDelay = delay;
}

CloudSamplePolicy Config::getCloudSamplePolicy() const {
    return cloudSamplePolicy;
}

void Config::setCloudSamplePolicy(const CloudSamplePolicy policy) {
    cloudSamplePolicy = policy;
}

bool Config::getWeightByClearSky() const {
    return weightByClearSky;
}

void Config::setWeightByClearSky(const bool weight) {
    weightByClearSky = weight;
}

void Config::addPlatform(Platform platform) {
    platforms.push_back(std::move(platform));
}

const std::vector<Platform>& Config::getPlatforms() const {
    return platforms;
}

double Config::getDefaultAcquisitionProbability() const {
    return defaultAcquisitionProbability;
}

void Config::setDefaultAcquisitionProbability(const double p) {
    defaultAcquisitionProbability = p;
}

double Config::acquisitionProbabilityFor(std::string_view satelliteName) const {
    for (const auto &platform : platforms) {
        if (satelliteName.find(platform.nameFragment) != std::string_view::npos) {
            return platform.acquisitionProbability;
        }
    }
    return defaultAcquisitionProbability;
}

unsigned int Config::getThreads() const {
    return threads;
}

void Config::setThreads(const unsigned int t) {
    threads = t;
}

DownloadPolicy Config::downloadPolicy() const {
    return {minDownloadDelay, maxDownloadDelay, maxDownloadsConsidered};
}

void Config::validate() const {
    using std::chrono::seconds;

    if (!finalTime) {
        throw ConfigurationError("Final time is not set");
    }
    if (maxAge <= seconds::zero()) {
        throw ConfigurationError("Maximum age must be positive");
    }
    if (!(cloudThreshold >= 0.0 && cloudThreshold <= 1.0)) {
        throw ConfigurationError(std::format("Cloud threshold {} is outside [0, 1]", cloudThreshold));
    }
    if (minDownloadDelay < seconds::zero()) {
        throw ConfigurationError("Minimum download delay must not be negative");
    }
    if (minDownloadDelay > maxDownloadDelay) {
        throw ConfigurationError(std::format("Minimum download delay {}s exceeds maximum download delay {}s",
                                             minDownloadDelay.count(), maxDownloadDelay.count()));
    }
    if (downloadFrequency < 1) {
        throw ConfigurationError("Download frequency must be at least 1");
    }
    if (maxDownloadsConsidered < 1) {
        throw ConfigurationError("Maximum downloads considered must be at least 1");
    }
    downloadTable.validate();
    if (scanStep <= seconds::zero()) {
        throw ConfigurationError("Scan step must be positive");
    }
    if (refinementTolerance <= seconds::zero()) {
        throw ConfigurationError("Refinement tolerance must be positive");
    }
    if (maxElementAge <= seconds::zero()) {
        throw ConfigurationError("Maximum element age must be positive");
    }
    if (processingDelay < seconds::zero()) {
        throw ConfigurationError("Processing delay must not be negative");
    }
    if (!(defaultAcquisitionProbability >= 0.0 && defaultAcquisitionProbability <= 1.0)) {
        throw ConfigurationError(std::format("Default acquisition probability {} is outside [0, 1]",
                                             defaultAcquisitionProbability));
    }
    for (const auto &platform : platforms) {
        if (platform.nameFragment.empty()) {
            throw ConfigurationError("Platform name fragment must not be empty");
        }
        if (!(platform.acquisitionProbability >= 0.0 && platform.acquisitionProbability <= 1.0)) {
            throw ConfigurationError(std::format("Acquisition probability {} for platform {} is outside [0, 1]",
                                                 platform.acquisitionProbability, platform.nameFragment));
        }
    }

    debug("Analysis window {} to {}", formatTimestamp(getWindowStart()), formatTimestamp(*finalTime));
    debug("Cloud threshold {} ({} hour), clear sky weighting {}",
          cloudThreshold, toString(cloudSamplePolicy), weightByClearSky ? "on" : "off");
    debug("Downloads {}s to {}s after capture, every {} gateway passes, at most {} per image",
          minDownloadDelay.count(), maxDownloadDelay.count(), downloadFrequency, maxDownloadsConsidered);
    debug("Scan step {}s, tolerance {}s, element age limit {}s, {} platforms",
          scanStep.count(), refinementTolerance.count(), maxElementAge.count(), platforms.size());
}

}
