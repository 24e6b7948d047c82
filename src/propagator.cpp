/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/propagator.hpp>
#include <satdeliver/errors.hpp>

#include <chrono>
#include <format>
#include <stdexcept>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::warn;

namespace satdeliver {

Propagator::Propagator(std::shared_ptr<const OrbitalElement> element,
                       std::chrono::seconds maxElementAge)
    : element_(std::move(element)), maxElementAge_(maxElementAge) {
    if (!element_) {
        throw std::invalid_argument("Propagator requires an orbital element");
    }
}

StateVector Propagator::stateAt(time_point t) const {
    using namespace std::chrono;

    auto offset = t - element_->getEpoch();
    if (abs(offset) > maxElementAge_) {
        auto message = std::format("Element epoch {} is more than {} days from {}",
            date::format("%F %T", floor<seconds>(element_->getEpoch())),
            duration_cast<hours>(maxElementAge_).count() / 24,
            date::format("%F %T", floor<seconds>(t)));
        warn("Satellite {}: {}", element_->getNoradID(), message);
        throw PropagationError(element_->getNoradID(), message);
    }

    const sgp4::Model &model = element_->model();
    double julianDate = toJulianDate(t);
    double tsince = (julianDate - model.jdEpoch - model.jdEpochFraction) * 1440.0;

    sgp4::Result result;
    try {
        result = sgp4::propagate(model, tsince);
    } catch (const sgp4::SGP4Exception &e) {
        throw PropagationError(element_->getNoradID(), e.what());
    }

    double gst = sgp4::gstime(julianDate);
    Vec3 position = temeToECEF({result.r[0], result.r[1], result.r[2]}, gst);
    Vec3 velocity = temeVelocityToECEF({result.v[0], result.v[1], result.v[2]}, position, gst);

    return {t, position, velocity};
}

}
