/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_GEODESY_HPP
#define __SATDELIVER_GEODESY_HPP

#include <chrono>
#include <cmath>
#include <numbers>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

constexpr double UNIX_EPOCH_JD = 2440587.5;                  // Julian Date of 1970-01-01T00:00:00Z
constexpr double EARTH_ROTATION_RATE = 7.292115146706979e-5; // rad/s

constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

namespace wgs84 {

constexpr double SEMI_MAJOR_AXIS = 6378.137;     // km
constexpr double FLATTENING = 1.0 / 298.257223563;
constexpr double ECCENTRICITY_SQUARED = FLATTENING * (2.0 - FLATTENING);

/**
 * Radius of curvature in the prime vertical, in kilometers.
 * @param sinLat Sine of the geodetic latitude
 */
inline double primeVerticalRadius(double sinLat) {
    return SEMI_MAJOR_AXIS / std::sqrt(1.0 - ECCENTRICITY_SQUARED * sinLat * sinLat);
}

}

/**
 * Cartesian vector. Units depend on use: km for positions, km/s for velocities.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3 &o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3 &o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double k) const { return {x * k, y * k, z * k}; }

    double dot(const Vec3 &o) const { return x * o.x + y * o.y + z * o.z; }
    double magnitude() const { return std::sqrt(dot(*this)); }
    Vec3 unit() const { return *this * (1.0 / magnitude()); }
};

/**
 * A position relative to the WGS84 ellipsoid.
 */
struct Geodetic {
    double latInRadians;      ///< Positive north
    double lonInRadians;      ///< Positive east
    double altInKilometers;   ///< Height above the ellipsoid

    Vec3 toECEF() const;

    /**
     * Builds a position from degrees and meters, the units input files use.
     */
    static Geodetic fromDegrees(double latDegrees, double lonDegrees, double altMeters = 0.0);
};

/**
 * A point expressed in an observer's local East-North-Up frame, in km.
 */
struct Topocentric {
    double east;
    double north;
    double up;

    double range() const { return std::sqrt(east * east + north * north + up * up); }

    /** Angle above the observer's horizon, in radians. */
    double elevation() const { return std::atan2(up, std::hypot(east, north)); }
};

/**
 * Converts a time_point to a Julian Date (UTC, no leap second correction).
 */
double toJulianDate(time_point tp);

/**
 * Rotates a TEME position into the Earth-fixed frame.
 * @param gst Greenwich sidereal angle in radians
 */
Vec3 temeToECEF(const Vec3 &teme, double gst);

/**
 * Rotates a TEME velocity into the Earth-fixed frame and removes the
 * velocity of the rotating frame at that point.
 * @param ecefPosition Position already converted with temeToECEF
 */
Vec3 temeVelocityToECEF(const Vec3 &teme, const Vec3 &ecefPosition, double gst);

/**
 * Expresses an Earth-fixed point in the observer's East-North-Up frame.
 */
Topocentric toTopocentric(const Vec3 &ecef, const Geodetic &observer);

/**
 * Angle between two vectors, in [0, π].
 */
double angleBetween(const Vec3 &a, const Vec3 &b);

/**
 * Angle at the satellite between straight down (towards the Earth's centre)
 * and the line of sight to a ground point.
 */
double offNadirAngle(const Vec3 &satECEF, const Vec3 &groundECEF);

}

#endif
