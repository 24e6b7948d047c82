/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/contact.hpp>
#include <satdeliver/parse.hpp>

#include <algorithm>
#include <stdexcept>
#include <tuple>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satdeliver {

std::string_view toString(ContactKind kind) {
    switch (kind) {
        case ContactKind::Download: return "download";
        case ContactKind::Image: return "image";
    }
    return "unknown";
}

bool operator<(const ContactOpportunity &a, const ContactOpportunity &b) {
    return std::tie(a.start, a.end, a.groundPoint, a.noradID)
         < std::tie(b.start, b.end, b.groundPoint, b.noradID);
}

// ============================================================================
// Visibility Predicates
// ============================================================================

GatewayVisibility::GatewayVisibility(const Gateway &gateway)
    : name_(gateway.name),
      location_(gateway.location),
      elevationMaskInRadians_(gateway.elevationMaskInRadians) {}

bool GatewayVisibility::holds(const StateVector &state) const {
    return toTopocentric(state.position, location_).elevation() >= elevationMaskInRadians_;
}

TargetAcquisition::TargetAcquisition(const Target &target)
    : name_(target.name),
      location_(target.location),
      locationECEF_(target.location.toECEF()),
      fieldOfRegardInRadians_(target.fieldOfRegardInRadians) {}

bool TargetAcquisition::holds(const StateVector &state) const {
    // The Earth blocks the line of sight below the target's horizon
    if (toTopocentric(state.position, location_).up < 0.0) {
        return false;
    }
    return offNadirAngle(state.position, locationECEF_) <= fieldOfRegardInRadians_;
}

// ============================================================================
// Contact Scanner
// ============================================================================

ContactScanner::ContactScanner(StateFunction state,
                               const VisibilityPredicate &predicate,
                               int noradID,
                               const ScanWindow &window,
                               double acquisitionProbability)
    : state_(std::move(state)),
      predicate_(predicate),
      noradID_(noradID),
      window_(window),
      acquisitionProbability_(acquisitionProbability) {
    if (window_.step <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Scan step must be positive");
    }
    if (window_.tolerance <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Refinement tolerance must be positive");
    }
}

ContactScanner::ContactScanner(const Propagator &propagator,
                               const VisibilityPredicate &predicate,
                               const ScanWindow &window,
                               double acquisitionProbability)
    : ContactScanner([&propagator](time_point t) { return propagator.stateAt(t); },
                     predicate, propagator.getNoradID(), window, acquisitionProbability) {}

bool ContactScanner::holdsAt(time_point t) {
    evaluations_++;
    return predicate_.holds(state_(t));
}

// Bisect a bracket whose ends disagree about the condition.
// Rising crossings return the first time the condition holds,
// setting crossings the last time it holds.
time_point ContactScanner::refineCrossing(time_point low, time_point high, bool rising) {
    while (high - low > window_.tolerance) {
        time_point mid = low + (high - low) / 2;
        bool holds = holdsAt(mid);

        if (rising) {
            if (holds) {
                high = mid;
            } else {
                low = mid;
            }
        } else {
            if (holds) {
                low = mid;
            } else {
                high = mid;
            }
        }
    }

    return rising ? high : low;
}

std::optional<ContactOpportunity> ContactScanner::makeOpportunity(time_point start, time_point end) const {
    if (start >= end) {
        return std::nullopt;
    }
    return ContactOpportunity{
        .kind = predicate_.kind(),
        .noradID = noradID_,
        .groundPoint = predicate_.groundPointName(),
        .start = start,
        .end = end,
        .acquisitionProbability = acquisitionProbability_
    };
}

std::optional<ContactOpportunity> ContactScanner::next() {
    if (done_) {
        return std::nullopt;
    }

    if (!started_) {
        started_ = true;
        cursor_ = window_.start;
        if (cursor_ >= window_.end) {
            done_ = true;
            return std::nullopt;
        }
        cursorHolds_ = holdsAt(cursor_);
        if (cursorHolds_) {
            openStart_ = cursor_;
        }
    }

    while (cursor_ < window_.end) {
        time_point sample = std::min<time_point>(cursor_ + window_.step, window_.end);
        bool sampleHolds = holdsAt(sample);

        std::optional<ContactOpportunity> closed;
        if (sampleHolds && !cursorHolds_) {
            openStart_ = refineCrossing(cursor_, sample, true);
        } else if (!sampleHolds && cursorHolds_) {
            time_point end = refineCrossing(cursor_, sample, false);
            closed = makeOpportunity(*openStart_, end);
            if (!closed) {
                debug("Satellite {} over {}: dropping empty interval at {}",
                      noradID_, predicate_.groundPointName(), formatTimestamp(end));
            }
            openStart_.reset();
        }

        cursor_ = sample;
        cursorHolds_ = sampleHolds;

        if (closed) {
            return closed;
        }
    }

    done_ = true;
    if (openStart_) {
        auto start = *openStart_;
        openStart_.reset();
        return makeOpportunity(start, window_.end);
    }
    return std::nullopt;
}

std::vector<ContactOpportunity> collectContacts(ContactScanner &scanner) {
    std::vector<ContactOpportunity> contacts;
    while (auto contact = scanner.next()) {
        contacts.push_back(std::move(*contact));
    }
    return contacts;
}

std::vector<ContactOpportunity> thinDownloads(std::vector<ContactOpportunity> downloads, int k) {
    if (k < 1) {
        throw std::invalid_argument("Download frequency must be at least 1");
    }

    std::sort(downloads.begin(), downloads.end());

    std::vector<ContactOpportunity> retained;
    retained.reserve((downloads.size() + k - 1) / k);
    for (size_t i = 0; i < downloads.size(); i += static_cast<size_t>(k)) {
        retained.push_back(std::move(downloads[i]));
    }
    return retained;
}

}
