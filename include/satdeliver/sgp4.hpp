/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Near-Earth SGP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __SATDELIVER_SGP4_HPP
#define __SATDELIVER_SGP4_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace satdeliver::sgp4 {

// Gravity model (WGS72, as used to generate TLEs)
constexpr double RADIUS_EARTH_KM = 6378.135;
constexpr double J2 = 0.001082616;
constexpr double J3 = -0.00000253881;
constexpr double J4 = -0.00000165597;
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // Earth radii^1.5 per minute
constexpr double VKMPERSEC = RADIUS_EARTH_KM * XKE / 60.0;
constexpr double TWO_PI = 2.0 * M_PI;
constexpr double X2O3 = 2.0 / 3.0;

// SDP4 territory, not implemented here
constexpr double DEEP_SPACE_PERIOD_MINUTES = 225.0;

/** Raised for any element set or time SGP4 cannot handle. */
class SGP4Exception : public std::runtime_error {
public:
    explicit SGP4Exception(const std::string& msg) : std::runtime_error(msg) {}
};

/** The orbit has decayed into the atmosphere at the requested time. */
class SatelliteDecayedException : public SGP4Exception {
public:
    explicit SatelliteDecayedException(const std::string& msg = "Satellite has decayed") : SGP4Exception(msg) {}
};

/** The element set is out of range or needs the deep space model. */
class InvalidOrbitException : public SGP4Exception {
public:
    explicit InvalidOrbitException(const std::string& msg) : SGP4Exception(msg) {}
};

/**
 * Mean elements taken from a TLE, in SGP4 units.
 */
struct Elements {
    double epochJD;
    double bstar;              // 1/earth radii
    double inclination;        // Angles in radians
    double raan;
    double eccentricity;
    double argPerigee;
    double meanAnomaly;
    double meanMotion;         // Kozai mean motion, rad/min
};

/**
 * Coefficients shared by every propagation of one element set. Read only
 * after initialize(), so one Model may be propagated from many threads.
 */
struct Model {
    // Epoch in Julian Date (split for precision)
    double jdEpoch = 0.0;
    double jdEpochFraction = 0.0;

    // Simple drag flag, set for perigees below 220 km
    bool isimp = false;

    // Mean elements at epoch
    double argpo = 0.0;
    double bstar = 0.0;
    double ecco = 0.0;
    double inclo = 0.0;
    double mo = 0.0;
    double nodeo = 0.0;
    double noUnkozai = 0.0;        // Un-Kozai'd mean motion (rad/min)
    double semiMajorAxis = 0.0;    // Earth radii
    double perigeeAltitudeKm = 0.0;

    // Secular rates and drag coefficients
    double aycof = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0;
    double eta = 0.0;
    double argpdot = 0.0;
    double omgcof = 0.0;
    double sinmao = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double mdot = 0.0;
    double nodedot = 0.0;
    double xlcof = 0.0;
    double xmcof = 0.0;
    double nodecf = 0.0;
};

/** TEME state: km and km/s. */
struct Result {
    double r[3];
    double v[3];
};

/**
 * Computes the secular and drag coefficients for one element set.
 * @throws InvalidOrbitException for out of range or deep space elements
 * @throws SatelliteDecayedException when the perigee is inside the Earth
 */
Model initialize(const Elements& elements);

/**
 * Evaluates the model.
 * @param tsince Minutes from the element epoch, negative to go backwards
 */
Result propagate(const Model& model, double tsince);

/** Greenwich mean sidereal time (IAU-82) in radians, in [0, 2π). */
double gstime(double jdut1);

} // namespace satdeliver::sgp4

#endif // __SATDELIVER_SGP4_HPP
