/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satdeliver/inputs.hpp>
#include <satdeliver/parse.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace satdeliver {
namespace {

constexpr double DEG = M_PI / 180.0;

// ============================================================================
// Gateways
// ============================================================================

TEST(LoadGatewaysTest, ParsesRows) {
    std::stringstream ss;
    ss << "name,latitude_deg,longitude_deg,altitude_m,elevation_mask_deg\n"
       << "# polar stations\n"
       << "Svalbard, 78.2298, 15.4078, 500, 5\n"
       << "Awarua,-46.5290,168.3810,20,10\n";

    auto gateways = loadGateways(ss);
    ASSERT_EQ(gateways.size(), 2u);

    EXPECT_EQ(gateways[0].name, "Svalbard");
    EXPECT_NEAR(gateways[0].location.latInRadians, 78.2298 * DEG, 1e-12);
    EXPECT_NEAR(gateways[0].location.lonInRadians, 15.4078 * DEG, 1e-12);
    EXPECT_NEAR(gateways[0].location.altInKilometers, 0.5, 1e-12);
    EXPECT_NEAR(gateways[0].elevationMaskInRadians, 5.0 * DEG, 1e-12);

    EXPECT_EQ(gateways[1].name, "Awarua");
    EXPECT_NEAR(gateways[1].location.latInRadians, -46.5290 * DEG, 1e-12);
}

TEST(LoadGatewaysTest, HeaderOnlyIsEmpty) {
    std::stringstream ss("name,latitude_deg,longitude_deg,altitude_m,elevation_mask_deg\n");
    EXPECT_TRUE(loadGateways(ss).empty());
}

TEST(LoadGatewaysTest, RejectsWrongFieldCount) {
    std::stringstream ss("header\nSvalbard,78.2,15.4,500\n");
    EXPECT_THROW(loadGateways(ss), std::invalid_argument);
}

TEST(LoadGatewaysTest, RejectsBadCoordinates) {
    std::stringstream latitude("header\nNowhere,91.0,0,0,5\n");
    EXPECT_THROW(loadGateways(latitude), std::invalid_argument);

    std::stringstream longitude("header\nNowhere,0,-181,0,5\n");
    EXPECT_THROW(loadGateways(longitude), std::invalid_argument);

    std::stringstream text("header\nNowhere,north,0,0,5\n");
    EXPECT_THROW(loadGateways(text), std::invalid_argument);
}

TEST(LoadGatewaysTest, RejectsElevationMaskOutOfRange) {
    std::stringstream negative("header\nG,0,0,0,-1\n");
    EXPECT_THROW(loadGateways(negative), std::invalid_argument);

    std::stringstream vertical("header\nG,0,0,0,90\n");
    EXPECT_THROW(loadGateways(vertical), std::invalid_argument);
}

TEST(LoadGatewaysTest, RejectsDuplicateNames) {
    std::stringstream ss("header\nG,0,0,0,5\nG,1,1,0,5\n");
    EXPECT_THROW(loadGateways(ss), std::invalid_argument);
}

TEST(LoadGatewaysTest, RejectsEmptyName) {
    std::stringstream ss("header\n ,0,0,0,5\n");
    EXPECT_THROW(loadGateways(ss), std::invalid_argument);
}

// ============================================================================
// Targets
// ============================================================================

TEST(LoadTargetsTest, ParsesRows) {
    std::stringstream ss;
    ss << "name,latitude_deg,longitude_deg,altitude_m,field_of_regard_deg\n"
       << "Paris,48.8566,2.3522,35,30\n"
       << "Denver,39.7392,255.0097,1609,45\n";

    auto targets = loadTargets(ss);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].name, "Paris");
    EXPECT_NEAR(targets[0].fieldOfRegardInRadians, 30.0 * DEG, 1e-12);
    EXPECT_TRUE(targets[0].clouds.empty());
    EXPECT_NEAR(targets[1].location.altInKilometers, 1.609, 1e-12);
}

TEST(LoadTargetsTest, RejectsFieldOfRegardOutOfRange) {
    std::stringstream zero("header\nT,0,0,0,0\n");
    EXPECT_THROW(loadTargets(zero), std::invalid_argument);

    std::stringstream wide("header\nT,0,0,0,90\n");
    EXPECT_THROW(loadTargets(wide), std::invalid_argument);
}

TEST(LoadTargetsTest, RejectsDuplicateNames) {
    std::stringstream ss("header\nT,0,0,0,30\nT,1,1,0,30\n");
    EXPECT_THROW(loadTargets(ss), std::invalid_argument);
}

class TargetFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path()
            / ("satdeliver_inputs_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir / "weather");

        std::ofstream targets(dir / "targets.csv");
        targets << "name,latitude_deg,longitude_deg,altitude_m,field_of_regard_deg\n"
                << "Paris,48.8566,2.3522,35,30\n"
                << "Lima,-12.0464,-77.0428,150,30\n";

        std::ofstream weather(dir / "weather" / "Paris.csv");
        weather << "timestamp,cloud_fraction\n"
                << "2025-12-01 00:00:00,0.3\n"
                << "2025-12-01 01:00:00,0.8\n";
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
};

TEST_F(TargetFilesTest, AttachesWeatherByName) {
    auto targets = loadTargets((dir / "targets.csv").string(), (dir / "weather").string());
    ASSERT_EQ(targets.size(), 2u);

    EXPECT_EQ(targets[0].clouds.size(), 2u);
    const double *fraction = targets[0].clouds.find(parseTimestamp("2025-12-01 01:15:00"));
    ASSERT_NE(fraction, nullptr);
    EXPECT_DOUBLE_EQ(*fraction, 0.8);

    // No Lima.csv: the target loads with no weather
    EXPECT_TRUE(targets[1].clouds.empty());
}

TEST_F(TargetFilesTest, MissingTargetFileThrows) {
    EXPECT_THROW(loadTargets((dir / "missing.csv").string(), (dir / "weather").string()), std::runtime_error);
    EXPECT_THROW(loadGateways((dir / "missing.csv").string()), std::runtime_error);
}

}
}
