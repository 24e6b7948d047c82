/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satdeliver/errors.hpp>
#include <satdeliver/parse.hpp>
#include <satdeliver/propagator.hpp>

#include <chrono>
#include <cmath>
#include <memory>

namespace satdeliver {
namespace {

using namespace std::chrono;

constexpr const char* ISS_TLE =
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

constexpr const char* NOAA19_TLE =
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

class PropagatorTest : public ::testing::Test {
protected:
    std::shared_ptr<const OrbitalElement> iss =
        std::make_shared<const OrbitalElement>(OrbitalElement::fromTLE(ISS_TLE));
    std::shared_ptr<const OrbitalElement> noaa19 =
        std::make_shared<const OrbitalElement>(OrbitalElement::fromTLE(NOAA19_TLE));
    seconds fortnight = duration_cast<seconds>(days{14});
};

TEST_F(PropagatorTest, RequiresElement) {
    EXPECT_THROW(Propagator(nullptr, fortnight), std::invalid_argument);
}

TEST_F(PropagatorTest, ExposesElement) {
    Propagator propagator(iss, fortnight);
    EXPECT_EQ(propagator.getNoradID(), 25544);
    EXPECT_EQ(&propagator.element(), iss.get());
    EXPECT_EQ(propagator.maxElementAge(), fortnight);
}

TEST_F(PropagatorTest, ISSOrbitRadius) {
    Propagator propagator(iss, fortnight);
    for (int minutes = 0; minutes < 180; minutes += 7) {
        auto state = propagator.stateAt(iss->getEpoch() + std::chrono::minutes(minutes));
        double radius = state.position.magnitude();
        EXPECT_GT(radius, 6700.0);
        EXPECT_LT(radius, 6900.0);
    }
}

TEST_F(PropagatorTest, ISSStaysWithinInclination) {
    Propagator propagator(iss, fortnight);
    for (int minutes = 0; minutes < 180; minutes += 5) {
        auto state = propagator.stateAt(iss->getEpoch() + std::chrono::minutes(minutes));
        // Geocentric latitude stays within the inclination
        double latitude = std::asin(state.position.z / state.position.magnitude());
        EXPECT_LE(std::abs(latitude * RADIANS_TO_DEGREES), 52.0);
    }
}

TEST_F(PropagatorTest, EarthFixedVelocity) {
    Propagator propagator(iss, fortnight);
    auto state = propagator.stateAt(iss->getEpoch() + hours(1));
    double speed = state.velocity.magnitude();
    // Inertial speed is about 7.66 km/s, less the rotation of the frame
    EXPECT_GT(speed, 7.0);
    EXPECT_LT(speed, 7.7);

    // Velocity is perpendicular to the radius for a near-circular orbit
    double radial = state.velocity.dot(state.position.unit());
    EXPECT_LT(std::abs(radial), 0.1);
}

TEST_F(PropagatorTest, VelocityMatchesPositionDifference) {
    Propagator propagator(noaa19, fortnight);
    auto t = noaa19->getEpoch() + hours(3);
    auto before = propagator.stateAt(t - milliseconds(500));
    auto after = propagator.stateAt(t + milliseconds(500));
    auto state = propagator.stateAt(t);

    Vec3 difference = after.position - before.position;
    EXPECT_NEAR(difference.x, state.velocity.x, 1e-2);
    EXPECT_NEAR(difference.y, state.velocity.y, 1e-2);
    EXPECT_NEAR(difference.z, state.velocity.z, 1e-2);
}

TEST_F(PropagatorTest, StateCarriesRequestedTime) {
    Propagator propagator(iss, fortnight);
    auto t = parseTimestamp("2025-11-30 06:00:00");
    EXPECT_EQ(propagator.stateAt(t).time, t);
}

TEST_F(PropagatorTest, RepeatedCallsAreIdentical) {
    Propagator propagator(iss, fortnight);
    auto t = parseTimestamp("2025-12-01 12:34:56");
    auto a = propagator.stateAt(t);
    auto b = propagator.stateAt(t);
    EXPECT_EQ(a.position.x, b.position.x);
    EXPECT_EQ(a.position.y, b.position.y);
    EXPECT_EQ(a.position.z, b.position.z);
    EXPECT_EQ(a.velocity.x, b.velocity.x);
}

TEST_F(PropagatorTest, PropagatesBackwards) {
    Propagator propagator(iss, fortnight);
    auto state = propagator.stateAt(iss->getEpoch() - days(2));
    EXPECT_GT(state.position.magnitude(), 6600.0);
}

TEST_F(PropagatorTest, RejectsTimesBeyondElementAge) {
    Propagator propagator(iss, fortnight);
    EXPECT_THROW(propagator.stateAt(iss->getEpoch() + days(15)), PropagationError);
    EXPECT_THROW(propagator.stateAt(iss->getEpoch() - days(15)), PropagationError);
    EXPECT_NO_THROW(propagator.stateAt(iss->getEpoch() + fortnight));
}

TEST_F(PropagatorTest, PropagationErrorNamesSatellite) {
    Propagator propagator(noaa19, hours(1));
    try {
        propagator.stateAt(noaa19->getEpoch() + hours(2));
        FAIL() << "Expected PropagationError";
    } catch (const PropagationError &e) {
        EXPECT_EQ(e.noradID(), 33591);
    }
}

}
}
