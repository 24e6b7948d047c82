/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/inputs.hpp>
#include <satdeliver/parse.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::info;
using spdlog::warn;

namespace satdeliver {

namespace {

constexpr size_t GROUND_POINT_FIELDS = 5;

// Calls fn with the fields of every data row after the header
void forEachRow(std::istream &s, const std::function<void(const std::vector<std::string_view>&)> &fn) {
    std::string line;
    bool headerSeen = false;
    int lineNumber = 0;
    while (std::getline(s, line)) {
        lineNumber++;
        std::string_view lineView = trim(line);
        if (lineView.empty() || lineView.starts_with('#')) continue;
        if (!headerSeen) {
            headerSeen = true;
            continue;
        }
        auto fields = splitFields(lineView, ',');
        if (fields.size() != GROUND_POINT_FIELDS) {
            throw std::invalid_argument("Line " + std::to_string(lineNumber) + ": expected "
                                        + std::to_string(GROUND_POINT_FIELDS) + " fields but got: "
                                        + std::string(lineView));
        }
        fn(fields);
    }
}

GroundPoint parseGroundPoint(const std::vector<std::string_view> &fields) {
    if (fields[0].empty()) {
        throw std::invalid_argument("Ground point name must not be empty");
    }
    double lat = toNumber<double>(fields[1]);
    double lon = toNumber<double>(fields[2]);
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 360.0) {
        throw std::invalid_argument("Invalid coordinates for " + std::string(fields[0]));
    }
    return {std::string(fields[0]), Geodetic::fromDegrees(lat, lon, toNumber<double>(fields[3]))};
}

std::ifstream openInput(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filepath);
    }
    return file;
}

}

std::vector<Gateway> loadGateways(std::istream &s) {
    std::vector<Gateway> gateways;
    std::set<std::string> names;
    forEachRow(s, [&](const std::vector<std::string_view> &fields) {
        Gateway gateway{parseGroundPoint(fields)};
        double mask = toNumber<double>(fields[4]);
        if (mask < 0.0 || mask >= 90.0) {
            throw std::invalid_argument("Elevation mask out of range for " + gateway.name);
        }
        gateway.elevationMaskInRadians = mask * DEGREES_TO_RADIANS;
        if (!names.insert(gateway.name).second) {
            throw std::invalid_argument("Duplicate gateway: " + gateway.name);
        }
        gateways.push_back(std::move(gateway));
    });
    return gateways;
}

std::vector<Gateway> loadGateways(const std::string &filepath) {
    auto file = openInput(filepath);
    auto gateways = loadGateways(file);
    info("Loaded {} gateways from {}", gateways.size(), filepath);
    return gateways;
}

std::vector<Target> loadTargets(std::istream &s) {
    std::vector<Target> targets;
    std::set<std::string> names;
    forEachRow(s, [&](const std::vector<std::string_view> &fields) {
        Target target{parseGroundPoint(fields)};
        double fieldOfRegard = toNumber<double>(fields[4]);
        if (fieldOfRegard <= 0.0 || fieldOfRegard >= 90.0) {
            throw std::invalid_argument("Field of regard out of range for " + target.name);
        }
        target.fieldOfRegardInRadians = fieldOfRegard * DEGREES_TO_RADIANS;
        if (!names.insert(target.name).second) {
            throw std::invalid_argument("Duplicate target: " + target.name);
        }
        targets.push_back(std::move(target));
    });
    return targets;
}

std::vector<Target> loadTargets(const std::string &filepath, const std::string &weatherDir) {
    auto file = openInput(filepath);
    auto targets = loadTargets(file);

    for (auto &target : targets) {
        auto weatherPath = std::filesystem::path(weatherDir) / (target.name + ".csv");
        if (!std::filesystem::exists(weatherPath)) {
            warn("No weather file for target {}: {}", target.name, weatherPath.string());
            continue;
        }
        target.clouds = loadCloudSeries(weatherPath.string());
    }

    info("Loaded {} targets from {}", targets.size(), filepath);
    return targets;
}

}
