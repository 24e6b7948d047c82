/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_CONTACT_HPP
#define __SATDELIVER_CONTACT_HPP

#include <satdeliver/ground.hpp>
#include <satdeliver/propagator.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace satdeliver {

enum class ContactKind {
    Download,
    Image
};

std::string_view toString(ContactKind kind);

/**
 * An interval during which a satellite and a ground point satisfy a
 * visibility condition.
 */
struct ContactOpportunity {
    ContactKind kind;
    int noradID;
    std::string groundPoint;
    time_point start;
    time_point end;
    double acquisitionProbability = 1.0;   ///< Only meaningful for Image opportunities

    time_point midpoint() const { return start + (end - start) / 2; }
};

/**
 * Chronological order; ties broken by end, ground point and satellite so
 * that merged sequences do not depend on the order they were produced in.
 */
bool operator<(const ContactOpportunity &a, const ContactOpportunity &b);

// ============================================================================
// Visibility Predicates
// ============================================================================

/**
 * Geometric condition between a satellite and one ground point.
 */
class VisibilityPredicate {
public:
    virtual ~VisibilityPredicate() = default;

    virtual bool holds(const StateVector &state) const = 0;
    virtual ContactKind kind() const = 0;
    virtual const std::string& groundPointName() const = 0;
};

/**
 * Satellite is at or above the gateway's elevation mask.
 */
class GatewayVisibility : public VisibilityPredicate {
public:
    explicit GatewayVisibility(const Gateway &gateway);

    bool holds(const StateVector &state) const override;
    ContactKind kind() const override { return ContactKind::Download; }
    const std::string& groundPointName() const override { return name_; }

private:
    std::string name_;
    Geodetic location_;
    double elevationMaskInRadians_;
};

/**
 * Target lies within the imager's field of regard, measured from nadir,
 * and the satellite is above the target's horizon.
 */
class TargetAcquisition : public VisibilityPredicate {
public:
    explicit TargetAcquisition(const Target &target);

    bool holds(const StateVector &state) const override;
    ContactKind kind() const override { return ContactKind::Image; }
    const std::string& groundPointName() const override { return name_; }

private:
    std::string name_;
    Geodetic location_;
    Vec3 locationECEF_;
    double fieldOfRegardInRadians_;
};

// ============================================================================
// Contact Scanner
// ============================================================================

using StateFunction = std::function<StateVector(time_point)>;

/**
 * Scan settings shared by every (satellite, ground point) pair.
 */
struct ScanWindow {
    time_point start;
    time_point end;
    std::chrono::seconds step{30};
    std::chrono::seconds tolerance{1};
};

/**
 * Produces the contact opportunities of one satellite over one ground point,
 * in time order, one at a time.
 *
 * The window is sampled every step. When the condition changes between two
 * samples, the crossing is refined by bisection until the bracket is no
 * wider than the tolerance. An opportunity already open at the start of the
 * window, or still open at its end, is truncated to the window.
 *
 * A scanner is single use: once next() returns no value it always will.
 * The predicate must outlive the scanner.
 */
class ContactScanner {
public:
    ContactScanner(StateFunction state,
                   const VisibilityPredicate &predicate,
                   int noradID,
                   const ScanWindow &window,
                   double acquisitionProbability = 1.0);

    ContactScanner(const Propagator &propagator,
                   const VisibilityPredicate &predicate,
                   const ScanWindow &window,
                   double acquisitionProbability = 1.0);

    /**
     * The next opportunity, or no value once the window is exhausted.
     *
     * @throws PropagationError if the satellite state cannot be computed
     */
    std::optional<ContactOpportunity> next();

    /**
     * Number of times the satellite state has been evaluated.
     */
    int evaluations() const { return evaluations_; }

private:
    bool holdsAt(time_point t);
    time_point refineCrossing(time_point low, time_point high, bool rising);
    std::optional<ContactOpportunity> makeOpportunity(time_point start, time_point end) const;

    StateFunction state_;
    const VisibilityPredicate &predicate_;
    int noradID_;
    ScanWindow window_;
    double acquisitionProbability_;

    bool started_ = false;
    bool done_ = false;
    time_point cursor_;
    bool cursorHolds_ = false;
    std::optional<time_point> openStart_;
    int evaluations_ = 0;
};

/**
 * Run a scanner to completion.
 */
std::vector<ContactOpportunity> collectContacts(ContactScanner &scanner);

/**
 * Sort download opportunities chronologically and keep every k-th one,
 * starting with the first.
 *
 * @throws std::invalid_argument if k < 1
 */
std::vector<ContactOpportunity> thinDownloads(std::vector<ContactOpportunity> downloads, int k);

}

#endif
