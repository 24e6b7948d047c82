/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_REPORT_HPP
#define __SATDELIVER_REPORT_HPP

#include <satdeliver/engine.hpp>

#include <ostream>
#include <string>

namespace satdeliver {

/**
 * Serialize a result as
 *   {"probabilities": {name: p, ...},
 *    "diagnostics": [{"kind": ..., "subject": ..., "message": ...}, ...]}
 */
std::string toJSON(const AnalysisResult &result);

void writeJSON(const AnalysisResult &result, std::ostream &os);

/**
 * Print probabilities and diagnostics as fixed-width tables.
 */
void printTable(const AnalysisResult &result, std::ostream &os);

}

#endif
