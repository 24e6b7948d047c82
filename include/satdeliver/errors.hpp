/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_ERRORS_HPP
#define __SATDELIVER_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

/**
 * Base class for all errors raised by the delivery probability engine.
 */
class DeliveryError : public std::runtime_error {
public:
    explicit DeliveryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Invalid analysis configuration. Raised before any computation starts.
 */
class ConfigurationError : public DeliveryError {
public:
    explicit ConfigurationError(const std::string& msg) : DeliveryError(msg) {}
};

/**
 * An orbital element cannot be used at the requested time.
 */
class PropagationError : public DeliveryError {
public:
    PropagationError(int noradID, const std::string& msg)
        : DeliveryError(msg), noradID_(noradID) {}

    int noradID() const { return noradID_; }

private:
    int noradID_;
};

/**
 * A target has no cloud-fraction sample for an hour the analysis needs.
 */
class MissingWeatherDataError : public DeliveryError {
public:
    MissingWeatherDataError(const std::string& target, time_point hour, const std::string& msg)
        : DeliveryError(msg), target_(target), hour_(hour) {}

    const std::string& target() const { return target_; }
    time_point hour() const { return hour_; }

private:
    std::string target_;
    time_point hour_;
};

}

#endif
