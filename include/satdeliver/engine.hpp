/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_ENGINE_HPP
#define __SATDELIVER_ENGINE_HPP

#include <satdeliver/config.hpp>
#include <satdeliver/element.hpp>
#include <satdeliver/ground.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace satdeliver {

enum class DiagnosticKind {
    PropagationFailure,   ///< A satellite's element could not be used
    MissingWeatherData,   ///< A target lacks cloud data; its probability is omitted
    NoCoverage,           ///< A target has no admissible image; its probability is 0
    NoElements            ///< A satellite has no orbital element to analyze
};

std::string_view toString(DiagnosticKind kind);

/**
 * A computation that was skipped or only partly done.
 */
struct Diagnostic {
    DiagnosticKind kind;
    std::string subject;    ///< Satellite catalog number or target name
    std::string message;
};

/**
 * Delivery probability per target name, plus everything that was skipped.
 */
struct AnalysisResult {
    std::map<std::string, double> probabilities;
    std::vector<Diagnostic> diagnostics;
};

/**
 * Computes delivery probabilities for every target from every satellite in
 * the catalog.
 *
 * Contact scans run on a worker pool, one task per (satellite, ground point)
 * pair. Results are merged in a fixed order so the output does not depend
 * on the number of workers.
 */
class DeliveryEngine {
public:
    DeliveryEngine(Config config,
                   ElementCatalog catalog,
                   std::vector<Gateway> gateways,
                   std::vector<Target> targets);

    /**
     * @throws ConfigurationError if the configuration is invalid, before any work starts
     */
    AnalysisResult run() const;

private:
    Config config;
    ElementCatalog catalog;
    std::vector<Gateway> gateways;
    std::vector<Target> targets;
};

}

#endif
