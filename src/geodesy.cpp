/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/geodesy.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace satdeliver {

double toJulianDate(time_point tp) {
    using fractional_days = std::chrono::duration<double, std::chrono::days::period>;
    return UNIX_EPOCH_JD + std::chrono::duration_cast<fractional_days>(tp.time_since_epoch()).count();
}

Vec3 temeToECEF(const Vec3 &teme, double gst) {
    const double c = std::cos(gst);
    const double s = std::sin(gst);
    return {c * teme.x + s * teme.y, c * teme.y - s * teme.x, teme.z};
}

Vec3 temeVelocityToECEF(const Vec3 &teme, const Vec3 &ecefPosition, double gst) {
    // ω × r for a rotation about +Z
    const Vec3 frameVelocity{
        -EARTH_ROTATION_RATE * ecefPosition.y,
         EARTH_ROTATION_RATE * ecefPosition.x,
         0.0
    };
    return temeToECEF(teme, gst) - frameVelocity;
}

Vec3 Geodetic::toECEF() const {
    const double sinLat = std::sin(latInRadians);
    const double horizontal = (wgs84::primeVerticalRadius(sinLat) + altInKilometers) * std::cos(latInRadians);
    return {
        horizontal * std::cos(lonInRadians),
        horizontal * std::sin(lonInRadians),
        (wgs84::primeVerticalRadius(sinLat) * (1.0 - wgs84::ECCENTRICITY_SQUARED) + altInKilometers) * sinLat
    };
}

Geodetic Geodetic::fromDegrees(double latDegrees, double lonDegrees, double altMeters) {
    return {latDegrees * DEGREES_TO_RADIANS, lonDegrees * DEGREES_TO_RADIANS, altMeters / 1000.0};
}

Topocentric toTopocentric(const Vec3 &ecef, const Geodetic &observer) {
    const Vec3 d = ecef - observer.toECEF();

    const double sinLat = std::sin(observer.latInRadians);
    const double cosLat = std::cos(observer.latInRadians);
    const double sinLon = std::sin(observer.lonInRadians);
    const double cosLon = std::cos(observer.lonInRadians);

    // Horizontal component towards the observer's meridian plane
    const double radial = cosLon * d.x + sinLon * d.y;

    return {
        cosLon * d.y - sinLon * d.x,
        cosLat * d.z - sinLat * radial,
        cosLat * radial + sinLat * d.z
    };
}

double angleBetween(const Vec3 &a, const Vec3 &b) {
    return std::acos(std::clamp(a.unit().dot(b.unit()), -1.0, 1.0));
}

double offNadirAngle(const Vec3 &satECEF, const Vec3 &groundECEF) {
    return angleBetween(satECEF * -1.0, groundECEF - satECEF);
}

}
