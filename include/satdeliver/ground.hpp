/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_GROUND_HPP
#define __SATDELIVER_GROUND_HPP

#include <satdeliver/cloud.hpp>
#include <satdeliver/geodesy.hpp>

#include <string>

namespace satdeliver {

/**
 * A fixed location on the Earth's surface.
 */
struct GroundPoint {
    std::string name;
    Geodetic location;
};

/**
 * A ground station that can receive image downloads.
 */
struct Gateway : GroundPoint {
    double elevationMaskInRadians = 10.0 * DEGREES_TO_RADIANS;
};

/**
 * A location to be imaged.
 */
struct Target : GroundPoint {
    double fieldOfRegardInRadians = 0.0;   ///< Half-angle of the imager's pointing cone
    CloudSeries clouds;
};

}

#endif
