/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_INPUTS_HPP
#define __SATDELIVER_INPUTS_HPP

#include <satdeliver/ground.hpp>

#include <istream>
#include <string>
#include <vector>

namespace satdeliver {

/**
 * Read gateways from CSV with a header row:
 *   name,latitude_deg,longitude_deg,altitude_m,elevation_mask_deg
 *
 * @throws std::invalid_argument for malformed rows
 */
std::vector<Gateway> loadGateways(std::istream &s);
std::vector<Gateway> loadGateways(const std::string &filepath);

/**
 * Read targets from CSV with a header row:
 *   name,latitude_deg,longitude_deg,altitude_m,field_of_regard_deg
 *
 * Cloud series are left empty.
 *
 * @throws std::invalid_argument for malformed rows
 */
std::vector<Target> loadTargets(std::istream &s);

/**
 * Read targets and attach each one's cloud series from
 * <weatherDir>/<name>.csv. A target without a weather file keeps an
 * empty series.
 */
std::vector<Target> loadTargets(const std::string &filepath, const std::string &weatherDir);

}

#endif
