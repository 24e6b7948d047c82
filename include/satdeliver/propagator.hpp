/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_PROPAGATOR_HPP
#define __SATDELIVER_PROPAGATOR_HPP

#include <satdeliver/element.hpp>
#include <satdeliver/geodesy.hpp>

#include <chrono>
#include <memory>

namespace satdeliver {

/**
 * Satellite position and velocity in the Earth-fixed (ECEF) frame.
 */
struct StateVector {
    time_point time;
    Vec3 position;   ///< km
    Vec3 velocity;   ///< km/s
};

/**
 * Evaluates the satellite state for one orbital element at arbitrary times.
 *
 * stateAt() depends only on the element and the requested time, so one
 * Propagator can be shared between threads.
 */
class Propagator {
public:
    /**
     * @param element The element to propagate; must not be null
     * @param maxElementAge Requests further than this from the element epoch are rejected
     */
    Propagator(std::shared_ptr<const OrbitalElement> element,
               std::chrono::seconds maxElementAge);

    /**
     * Satellite state at the given time.
     *
     * @throws PropagationError if t is beyond the element age limit, or SGP4
     *         cannot produce a position (decay, invalid orbit)
     */
    StateVector stateAt(time_point t) const;

    int getNoradID() const { return element_->getNoradID(); }
    const OrbitalElement& element() const { return *element_; }
    std::chrono::seconds maxElementAge() const { return maxElementAge_; }

private:
    std::shared_ptr<const OrbitalElement> element_;
    std::chrono::seconds maxElementAge_;
};

}

#endif
