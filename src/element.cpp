/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/element.hpp>
#include <satdeliver/geodesy.hpp>
#include <satdeliver/parse.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace satdeliver {

namespace {

constexpr size_t TLE_LINE_LENGTH = 69;

// TLE fields like "+.00002182" carry an explicit sign that from_chars rejects
double toSignedDouble(std::string_view str) {
    str = trimLeft(str);
    bool negative = false;
    if (!str.empty() && (str[0] == '+' || str[0] == '-')) {
        negative = str[0] == '-';
        str.remove_prefix(1);
    }
    std::string digits(str);
    if (digits.starts_with('.')) {
        digits.insert(digits.begin(), '0');
    }
    double value = toNumber<double>(digits);
    return negative ? -value : value;
}

// "11606-4" -> 0.11606e-4, "-11606-4" -> -0.11606e-4, " 00000+0" -> 0
double fromExponentialString(std::string_view str) {
    str = trimLeft(str);
    bool negativeMantissa = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
        negativeMantissa = str[0] == '-';
        str.remove_prefix(1);
    }

    auto pos = str.find_last_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw std::invalid_argument("Invalid exponential format: " + std::string(str));
    }
    bool negativeExponent = str[pos] == '-';

    double base = toNumber<double>("0." + std::string(trimLeft(str.substr(0, pos))));
    int exponent = toNumber<int>(str.substr(pos + 1));
    double value = base * std::pow(10.0, negativeExponent ? -exponent : exponent);
    return negativeMantissa ? -value : value;
}

// TLE epoch format is YYDDD.DDDDDDDD
time_point parseEpoch(const std::string_view &epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)));
    double dayOfYear = toNumber<double>(trimLeft(trimRight(epochStr.substr(2))));

    // Two-digit years from 57 onwards are in the 1900s
    y += (y < 57) ? 2000 : 1900;

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return time_point(date) + time;
}

void requireLength(std::string_view line) {
    if (line.size() < TLE_LINE_LENGTH - 1) {
        throw std::invalid_argument("TLE line too short: " + std::string(line));
    }
}

}

// ============================================================================
// OrbitalElement
// ============================================================================

OrbitalElement OrbitalElement::fromTLE(std::string_view name, std::string_view tle) {
    OrbitalElement element = fromTLE(tle);
    element.name = std::string(name);
    return element;
}

OrbitalElement OrbitalElement::fromTLE(std::string_view tle) {
    OrbitalElement element;

    bool firstLineParsed = false;
    bool secondLineParsed = false;
    for (auto line : tle | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trimLeft(trimRight(lineStr));

        if (lineView.starts_with("1 ")) {
            requireLength(lineView);
            element.noradID = toNumber<int>(trimLeft(lineView.substr(2, 5)));
            element.classification = lineView[7];
            element.designator = std::string(trimRight(lineView.substr(9, 8)));
            element.epoch = parseEpoch(lineView.substr(18, 14));
            element.firstDerivativeMeanMotion = toSignedDouble(lineView.substr(33, 10));
            element.secondDerivativeMeanMotion = fromExponentialString(lineView.substr(44, 8));
            element.bstarDragTerm = fromExponentialString(lineView.substr(53, 8));
            element.elementSetNumber = toNumber<int>(trimLeft(lineView.substr(64, 4)));
            firstLineParsed = true;
        } else if (lineView.starts_with("2 ")) {
            requireLength(lineView);
            int secondLineID = toNumber<int>(trimLeft(lineView.substr(2, 5)));
            if (firstLineParsed && secondLineID != element.noradID) {
                throw std::invalid_argument("TLE line 2 catalog number does not match line 1: "
                                            + std::string(lineView));
            }
            element.inclination = toNumber<double>(trimLeft(lineView.substr(8, 8)));
            element.rightAscensionOfAscendingNode = toNumber<double>(trimLeft(lineView.substr(17, 8)));
            element.eccentricity = toNumber<double>("0." + std::string(trimLeft(lineView.substr(26, 7))));
            element.argumentOfPerigee = toNumber<double>(trimLeft(lineView.substr(34, 8)));
            element.meanAnomaly = toNumber<double>(trimLeft(lineView.substr(43, 8)));
            element.meanMotion = toNumber<double>(trimLeft(lineView.substr(52, 11)));
            element.revolutionNumberAtEpoch = toNumber<int>(trimLeft(trimRight(lineView.substr(63, 5))));
            secondLineParsed = true;
        } else if (!firstLineParsed && !secondLineParsed && !lineView.empty()) {
            // A leading line that is neither line 1 nor line 2 is the name
            std::string_view nameView = lineView;
            if (nameView.starts_with("0 ")) {
                nameView.remove_prefix(2);
            }
            element.name = std::string(nameView);
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed || !secondLineParsed) {
        throw std::invalid_argument("Incomplete TLE: " + std::string(tle));
    }

    sgp4::Elements elements{
        .epochJD = toJulianDate(element.epoch),
        .bstar = element.bstarDragTerm,
        .inclination = element.inclination * DEGREES_TO_RADIANS,
        .raan = element.rightAscensionOfAscendingNode * DEGREES_TO_RADIANS,
        .eccentricity = element.eccentricity,
        .argPerigee = element.argumentOfPerigee * DEGREES_TO_RADIANS,
        .meanAnomaly = element.meanAnomaly * DEGREES_TO_RADIANS,
        .meanMotion = element.meanMotion * sgp4::TWO_PI / 1440.0
    };
    element.model_ = sgp4::initialize(elements);

    return element;
}

// ============================================================================
// ElementHistory
// ============================================================================

bool ElementHistory::add(OrbitalElement element) {
    auto epoch = element.getEpoch();
    auto it = std::ranges::lower_bound(elements_, epoch, {},
        [](const ElementPtr &e) { return e->getEpoch(); });
    if (it != elements_.end() && (*it)->getEpoch() == epoch) {
        return false;
    }
    elements_.insert(it, std::make_shared<const OrbitalElement>(std::move(element)));
    return true;
}

ElementHistory::ElementPtr ElementHistory::closestTo(time_point t) const {
    if (elements_.empty()) {
        return nullptr;
    }

    // First element with epoch >= t
    auto after = std::ranges::lower_bound(elements_, t, {},
        [](const ElementPtr &e) { return e->getEpoch(); });
    if (after == elements_.begin()) {
        return *after;
    }
    auto before = std::prev(after);
    if (after == elements_.end()) {
        return *before;
    }

    auto distanceBefore = t - (*before)->getEpoch();
    auto distanceAfter = (*after)->getEpoch() - t;
    return distanceBefore <= distanceAfter ? *before : *after;
}

// ============================================================================
// Catalog Loading
// ============================================================================

int loadElementCatalog(const std::string &filepath, ElementCatalog &catalog) {
    info("Loading TLE catalog from file: {}", filepath);
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("TLE catalog file does not exist: " + filepath);
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE catalog file: " + filepath);
    }
    return loadElementCatalog(file, catalog);
}

int loadElementCatalog(std::istream &s, ElementCatalog &catalog) {
    bool haveFirstLine = false;
    std::string line, line1, nameLine;
    int entriesLoaded = 0;
    int entriesSkipped = 0;

    while (std::getline(s, line)) {
        std::string_view lineView = trimRight(line);
        if (lineView.empty()) continue;

        if (lineView.starts_with("1 ")) {
            line1 = std::string(lineView);
            haveFirstLine = true;
            continue;
        }

        if (!lineView.starts_with("2 ")) {
            nameLine = std::string(lineView);
            haveFirstLine = false;
            continue;
        }

        if (!haveFirstLine) {
            warn("Skipping TLE line 2 without a preceding line 1: {}", lineView);
            continue;
        }

        std::ostringstream tleStream;
        tleStream << nameLine << '\n' << line1 << '\n' << lineView << '\n';

        try {
            auto element = OrbitalElement::fromTLE(tleStream.str());
            int id = element.getNoradID();
            if (catalog[id].add(std::move(element))) {
                entriesLoaded++;
            } else {
                debug("Ignoring duplicate epoch for satellite {}", id);
            }
        } catch (const std::invalid_argument &e) {
            warn("Skipping malformed TLE entry '{}': {}", nameLine, e.what());
            entriesSkipped++;
        } catch (const SGP4Exception &e) {
            warn("Skipping unusable TLE entry '{}': {}", nameLine, e.what());
            entriesSkipped++;
        }

        haveFirstLine = false;
        line1.clear();
        nameLine.clear();
    }

    info("Loaded {} TLE entries ({} skipped) for {} satellites.",
         entriesLoaded, entriesSkipped, catalog.size());
    return entriesLoaded;
}

}
