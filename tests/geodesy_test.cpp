/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satdeliver/geodesy.hpp>

#include <chrono>
#include <cmath>

namespace satdeliver {
namespace {

// ============================================================================
// Julian Date
// ============================================================================

TEST(JulianDateTest, UnixEpoch) {
    auto unixEpoch = std::chrono::system_clock::from_time_t(0);
    EXPECT_NEAR(toJulianDate(unixEpoch), 2440587.5, 1e-6);
}

TEST(JulianDateTest, KnownDate) {
    using namespace std::chrono;
    // 2024-03-20 00:00:00 UTC
    time_point tp = sys_days{year{2024}/March/20};
    EXPECT_NEAR(toJulianDate(tp), 2460389.5, 1e-6);

    EXPECT_NEAR(toJulianDate(tp + hours(18)), 2460390.25, 1e-6);
}

// ============================================================================
// Frame Transforms
// ============================================================================

TEST(TEMEToECEFTest, QuarterRotation) {
    Vec3 ecef = temeToECEF({1000.0, 0.0, 0.0}, M_PI / 2.0);
    EXPECT_NEAR(ecef.x, 0.0, 1e-10);
    EXPECT_NEAR(ecef.y, -1000.0, 1e-10);
    EXPECT_NEAR(ecef.z, 0.0, 1e-10);
}

TEST(TEMEToECEFTest, PreservesMagnitudeAndAxis) {
    Vec3 teme{1000.0, 2000.0, 3000.0};
    Vec3 ecef = temeToECEF(teme, 0.789);
    EXPECT_NEAR(ecef.magnitude(), teme.magnitude(), 1e-10);
    EXPECT_DOUBLE_EQ(ecef.z, teme.z);
}

TEST(TEMEVelocityToECEFTest, CoRotatingPointIsStationary) {
    double radius = 42164.0;
    Vec3 position{radius, 0.0, 0.0};
    Vec3 inertialVelocity{0.0, radius * EARTH_ROTATION_RATE, 0.0};

    Vec3 velocity = temeVelocityToECEF(inertialVelocity, position, 0.0);
    EXPECT_NEAR(velocity.magnitude(), 0.0, 1e-9);
}

TEST(GeodeticTest, EquatorPrimeMeridian) {
    Vec3 ecef = Geodetic::fromDegrees(0.0, 0.0).toECEF();
    EXPECT_NEAR(ecef.x, wgs84::SEMI_MAJOR_AXIS, 1e-9);
    EXPECT_NEAR(ecef.y, 0.0, 1e-9);
    EXPECT_NEAR(ecef.z, 0.0, 1e-9);
}

TEST(GeodeticTest, NorthPole) {
    double polarRadius = wgs84::SEMI_MAJOR_AXIS * (1.0 - wgs84::FLATTENING);
    Vec3 ecef = Geodetic::fromDegrees(90.0, 0.0, 400000.0).toECEF();
    EXPECT_NEAR(ecef.x, 0.0, 1e-9);
    EXPECT_NEAR(ecef.y, 0.0, 1e-9);
    EXPECT_NEAR(ecef.z, polarRadius + 400.0, 1e-9);
}

TEST(GeodeticTest, AltitudeAlongNormal) {
    // Raising a point moves it along the ellipsoid normal, which at 45 degrees
    // points equally outwards and upwards
    Vec3 ground = Geodetic::fromDegrees(45.0, 0.0).toECEF();
    Vec3 raised = Geodetic::fromDegrees(45.0, 0.0, 1000.0).toECEF();
    Vec3 offset = raised - ground;
    EXPECT_NEAR(offset.magnitude(), 1.0, 1e-9);
    EXPECT_NEAR(offset.x, offset.z, 1e-9);
    EXPECT_NEAR(offset.y, 0.0, 1e-12);
}

TEST(GeodeticTest, FromDegreesConvertsUnits) {
    Geodetic geo = Geodetic::fromDegrees(64.8, -147.7, 150.0);
    EXPECT_NEAR(geo.latInRadians, 64.8 * DEGREES_TO_RADIANS, 1e-12);
    EXPECT_NEAR(geo.lonInRadians, -147.7 * DEGREES_TO_RADIANS, 1e-12);
    EXPECT_NEAR(geo.altInKilometers, 0.15, 1e-12);
}

// ============================================================================
// Topocentric Frame
// ============================================================================

TEST(TopocentricTest, SatelliteDirectlyOverhead) {
    Geodetic observer = Geodetic::fromDegrees(45.0, 10.0);
    Geodetic above = Geodetic::fromDegrees(45.0, 10.0, 500000.0);

    Topocentric enu = toTopocentric(above.toECEF(), observer);
    EXPECT_NEAR(enu.east, 0.0, 1e-6);
    EXPECT_NEAR(enu.north, 0.0, 1e-6);
    EXPECT_NEAR(enu.elevation(), M_PI / 2.0, 1e-6);
    EXPECT_NEAR(enu.range(), 500.0, 1e-6);
}

TEST(TopocentricTest, AxesPointEastAndNorth) {
    Geodetic observer = Geodetic::fromDegrees(0.0, 0.0);

    Topocentric east = toTopocentric(Geodetic::fromDegrees(0.0, 1.0).toECEF(), observer);
    EXPECT_GT(east.east, 100.0);
    EXPECT_NEAR(east.north, 0.0, 1e-6);

    Topocentric north = toTopocentric(Geodetic::fromDegrees(1.0, 0.0).toECEF(), observer);
    EXPECT_GT(north.north, 100.0);
    EXPECT_NEAR(north.east, 0.0, 1e-6);

    // Points on the surface drop below the tangent plane
    EXPECT_LT(east.elevation(), 0.0);
}

TEST(TopocentricTest, SatelliteBelowHorizon) {
    Geodetic observer = Geodetic::fromDegrees(0.0, 0.0);
    Geodetic antipode = Geodetic::fromDegrees(0.0, 180.0, 500000.0);

    Topocentric enu = toTopocentric(antipode.toECEF(), observer);
    EXPECT_LT(enu.up, 0.0);
    EXPECT_LT(enu.elevation(), 0.0);
}

// ============================================================================
// Angles
// ============================================================================

TEST(AngleBetweenTest, PerpendicularAndParallel) {
    EXPECT_NEAR(angleBetween({1, 0, 0}, {0, 1, 0}), M_PI / 2.0, 1e-12);
    EXPECT_NEAR(angleBetween({1, 0, 0}, {3, 0, 0}), 0.0, 1e-12);
    EXPECT_NEAR(angleBetween({1, 0, 0}, {-2, 0, 0}), M_PI, 1e-12);
}

TEST(OffNadirAngleTest, PointBelowSatelliteIsAtNadir) {
    // On the equator the ellipsoid normal passes through the Earth's centre
    Geodetic ground = Geodetic::fromDegrees(0.0, 40.0);
    Geodetic satellite = Geodetic::fromDegrees(0.0, 40.0, 500000.0);

    EXPECT_NEAR(offNadirAngle(satellite.toECEF(), ground.toECEF()), 0.0, 1e-6);
}

TEST(OffNadirAngleTest, GrowsWithGroundDistance) {
    Vec3 satellite = Geodetic::fromDegrees(0.0, 0.0, 500000.0).toECEF();

    double near = offNadirAngle(satellite, Geodetic::fromDegrees(0.0, 1.0).toECEF());
    double far = offNadirAngle(satellite, Geodetic::fromDegrees(0.0, 5.0).toECEF());

    EXPECT_GT(near, 0.0);
    EXPECT_GT(far, near);
    // From 500 km up the Earth's limb is about 68 degrees off nadir
    EXPECT_LT(far, 68.0 * DEGREES_TO_RADIANS);
}

}
}
