/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_ELEMENT_HPP
#define __SATDELIVER_ELEMENT_HPP

#include <satdeliver/sgp4.hpp>

#include <chrono>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace satdeliver {

using time_point = std::chrono::system_clock::time_point;

// Re-export SGP4 exceptions
using SGP4Exception = sgp4::SGP4Exception;
using SatelliteDecayedException = sgp4::SatelliteDecayedException;
using InvalidOrbitException = sgp4::InvalidOrbitException;

// ============================================================================
// Orbital Element
// ============================================================================

/**
 * Orbital state of one satellite at a reference epoch, parsed from a TLE.
 *
 * An OrbitalElement never changes after it is built. A newer TLE for the
 * same satellite produces a new OrbitalElement that is appended to the
 * satellite's ElementHistory.
 *
 * Usage:
 *   auto element = OrbitalElement::fromTLE(tleString);
 *   sgp4::Result r = sgp4::propagate(element.model(), minutesSinceEpoch);
 */
class OrbitalElement {
public:
    /**
     * Parse a two-line or three-line TLE. The name line is optional.
     *
     * @throws std::invalid_argument if a required line is missing or a field is malformed
     * @throws InvalidOrbitException if the orbit needs deep-space propagation
     */
    static OrbitalElement fromTLE(std::string_view tle);

    /**
     * Parse a TLE and give the satellite an explicit name.
     */
    static OrbitalElement fromTLE(std::string_view name, std::string_view tle);

    // Accessors for TLE data
    const std::string& getName() const { return name; }
    int getNoradID() const { return noradID; }
    char getClassification() const { return classification; }
    const std::string& getDesignator() const { return designator; }
    time_point getEpoch() const { return epoch; }
    double getFirstDerivativeMeanMotion() const { return firstDerivativeMeanMotion; }
    double getSecondDerivativeMeanMotion() const { return secondDerivativeMeanMotion; }
    double getBstarDragTerm() const { return bstarDragTerm; }
    int getElementSetNumber() const { return elementSetNumber; }

    // Accessors for orbital elements (degrees, except eccentricity)
    double getInclination() const { return inclination; }
    double getRightAscensionOfAscendingNode() const { return rightAscensionOfAscendingNode; }
    double getEccentricity() const { return eccentricity; }
    double getArgumentOfPerigee() const { return argumentOfPerigee; }
    double getMeanAnomaly() const { return meanAnomaly; }
    double getMeanMotion() const { return meanMotion; }  // revolutions per day
    int getRevolutionNumberAtEpoch() const { return revolutionNumberAtEpoch; }

    /**
     * The SGP4 model built from these elements.
     */
    const sgp4::Model& model() const { return model_; }

private:
    OrbitalElement() = default;

    std::string name;

    // First Line
    int noradID = 0;
    char classification = 'U';
    std::string designator;
    time_point epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;

    // Second Line
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;
    int revolutionNumberAtEpoch = 0;

    sgp4::Model model_;
};

// ============================================================================
// Element History
// ============================================================================

/**
 * Append-only, epoch-ordered sequence of elements for one satellite.
 */
class ElementHistory {
public:
    using ElementPtr = std::shared_ptr<const OrbitalElement>;

    /**
     * Add an element. Returns false if an element with the same epoch is
     * already present, in which case the history is unchanged.
     */
    bool add(OrbitalElement element);

    /**
     * The element whose epoch is nearest to the given time. Ties go to the
     * earlier epoch. Returns null if the history is empty.
     */
    ElementPtr closestTo(time_point t) const;

    bool empty() const { return elements_.empty(); }
    size_t size() const { return elements_.size(); }
    const std::vector<ElementPtr>& elements() const { return elements_; }

private:
    std::vector<ElementPtr> elements_;
};

/**
 * Element histories keyed by NORAD catalog number.
 */
using ElementCatalog = std::map<int, ElementHistory>;

// ============================================================================
// TLE Catalog Loading
// ============================================================================

/**
 * Read concatenated two-line or three-line TLE entries and append every
 * entry to the catalog. Entries that fail to parse are logged and skipped.
 *
 * @return Number of elements added
 */
int loadElementCatalog(std::istream &s, ElementCatalog &catalog);

/**
 * @throws std::runtime_error if the file cannot be opened
 */
int loadElementCatalog(const std::string &filepath, ElementCatalog &catalog);

}

#endif
