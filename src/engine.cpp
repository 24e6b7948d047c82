/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver/engine.hpp>
#include <satdeliver/aggregator.hpp>
#include <satdeliver/contact.hpp>
#include <satdeliver/download.hpp>
#include <satdeliver/errors.hpp>
#include <satdeliver/feasibility.hpp>
#include <satdeliver/parse.hpp>
#include <satdeliver/propagator.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <optional>
#include <map>
#include <thread>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace satdeliver {

std::string_view toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::PropagationFailure: return "PropagationFailure";
        case DiagnosticKind::MissingWeatherData: return "MissingWeatherData";
        case DiagnosticKind::NoCoverage: return "NoCoverage";
        case DiagnosticKind::NoElements: return "NoElements";
    }
    return "Unknown";
}

namespace {

// A satellite taking part in the analysis
struct Satellite {
    std::string name;
    double acquisitionProbability;
    Propagator propagator;
};

struct DownloadScan {
    std::vector<ContactOpportunity> contacts;
    std::optional<std::string> propagationFailure;
};

struct ImageScan {
    size_t satellite;
    std::vector<ImageOpportunity> images;
    std::optional<std::string> propagationFailure;
    std::optional<std::string> missingWeather;
};

// Run fn on the pool and hand its result, or its exception, back through a future
template <typename Fn>
auto submit(asio::thread_pool &pool, Fn fn) -> std::future<decltype(fn())> {
    auto task = std::make_shared<std::packaged_task<decltype(fn())()>>(std::move(fn));
    auto future = task->get_future();
    asio::post(pool, [task]() { (*task)(); });
    return future;
}

unsigned int workerCount(const Config &config) {
    unsigned int threads = config.getThreads();
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    return threads;
}

DownloadScan scanDownloads(const Satellite &satellite, const Gateway &gateway, const ScanWindow &window) {
    DownloadScan result;
    GatewayVisibility predicate(gateway);
    ContactScanner scanner(satellite.propagator, predicate, window);
    try {
        result.contacts = collectContacts(scanner);
    } catch (const PropagationError &e) {
        result.contacts.clear();
        result.propagationFailure = e.what();
    }
    debug("Satellite {} over gateway {}: {} passes, {} evaluations",
          satellite.propagator.getNoradID(), gateway.name, result.contacts.size(), scanner.evaluations());
    return result;
}

ImageScan scanImages(size_t index, const Satellite &satellite, const Target &target,
                     const ScanWindow &window, const Config &config) {
    ImageScan result{.satellite = index};
    TargetAcquisition predicate(target);
    ContactScanner scanner(satellite.propagator, predicate, window, satellite.acquisitionProbability);
    try {
        while (auto contact = scanner.next()) {
            auto image = filterImage(*contact, target.clouds,
                                     config.getCloudThreshold(), config.getCloudSamplePolicy());
            if (image) {
                result.images.push_back(std::move(*image));
            }
        }
    } catch (const PropagationError &e) {
        result.images.clear();
        result.propagationFailure = e.what();
    } catch (const MissingWeatherDataError &e) {
        result.images.clear();
        result.missingWeather = e.what();
    }
    debug("Satellite {} over target {}: {} admissible images",
          satellite.propagator.getNoradID(), target.name, result.images.size());
    return result;
}

}

DeliveryEngine::DeliveryEngine(Config config,
                               ElementCatalog catalog,
                               std::vector<Gateway> gateways,
                               std::vector<Target> targets)
    : config(std::move(config)),
      catalog(std::move(catalog)),
      gateways(std::move(gateways)),
      targets(std::move(targets)) {}

AnalysisResult DeliveryEngine::run() const {
    config.validate();

    AnalysisResult result;
    const ScanWindow window{
        .start = config.getWindowStart(),
        .end = config.getFinalTime(),
        .step = config.getScanStep(),
        .tolerance = config.getRefinementTolerance()
    };

    info("Analyzing {} satellites, {} gateways and {} targets from {} to {}",
         catalog.size(), gateways.size(), targets.size(),
         formatTimestamp(window.start), formatTimestamp(window.end));

    // ========================================================================
    // Element selection
    // ========================================================================

    // The element closest to the start of the window, when the data starts having value
    std::vector<Satellite> satellites;
    for (const auto &[noradID, history] : catalog) {
        auto element = history.closestTo(window.start);
        if (!element) {
            warn("Satellite {} has no orbital elements", noradID);
            result.diagnostics.push_back({DiagnosticKind::NoElements, std::to_string(noradID),
                                          "No orbital elements available"});
            continue;
        }
        satellites.push_back({
            element->getName(),
            config.acquisitionProbabilityFor(element->getName()),
            Propagator(element, config.getMaxElementAge())
        });
    }
    if (catalog.empty()) {
        warn("Element catalog is empty");
        result.diagnostics.push_back({DiagnosticKind::NoElements, "catalog",
                                      "No orbital elements available for any satellite"});
    }

    asio::thread_pool pool(workerCount(config));

    // ========================================================================
    // Download contacts, merged and thinned per satellite
    // ========================================================================

    std::vector<std::vector<std::future<DownloadScan>>> downloadScans(satellites.size());
    for (size_t s = 0; s < satellites.size(); s++) {
        for (const auto &gateway : gateways) {
            const Satellite &satellite = satellites[s];
            downloadScans[s].push_back(submit(pool, [&satellite, &gateway, &window]() {
                return scanDownloads(satellite, gateway, window);
            }));
        }
    }

    // Satellite index -> first propagation failure
    std::map<size_t, std::string> failed;
    std::vector<std::vector<ContactOpportunity>> downloads(satellites.size());
    for (size_t s = 0; s < satellites.size(); s++) {
        std::vector<ContactOpportunity> merged;
        std::optional<std::string> failure;
        for (auto &future : downloadScans[s]) {
            auto scan = future.get();
            if (scan.propagationFailure && !failure) {
                failure = scan.propagationFailure;
            }
            merged.insert(merged.end(), scan.contacts.begin(), scan.contacts.end());
        }

        if (failure) {
            failed.emplace(s, *failure);
            continue;
        }

        size_t raw = merged.size();
        downloads[s] = thinDownloads(std::move(merged), config.getDownloadFrequency());
        debug("Satellite {}: {} download passes, {} retained",
              satellites[s].propagator.getNoradID(), raw, downloads[s].size());
    }

    // ========================================================================
    // Image contacts filtered by cloud cover
    // ========================================================================

    std::vector<std::vector<std::future<ImageScan>>> imageScans(targets.size());
    for (size_t t = 0; t < targets.size(); t++) {
        for (size_t s = 0; s < satellites.size(); s++) {
            if (failed.contains(s)) {
                continue;
            }
            const Satellite &satellite = satellites[s];
            const Target &target = targets[t];
            imageScans[t].push_back(submit(pool, [this, s, &satellite, &target, &window]() {
                return scanImages(s, satellite, target, window, config);
            }));
        }
    }

    std::vector<std::vector<ImageScan>> imagesByTarget(targets.size());
    for (size_t t = 0; t < targets.size(); t++) {
        for (auto &future : imageScans[t]) {
            imagesByTarget[t].push_back(future.get());
        }
    }

    pool.join();

    // Image scans sample at refinement times the download scans never visited
    for (const auto &scansForTarget : imagesByTarget) {
        for (const auto &scan : scansForTarget) {
            if (scan.propagationFailure) {
                failed.emplace(scan.satellite, *scan.propagationFailure);
            }
        }
    }

    for (const auto &[s, message] : failed) {
        int noradID = satellites[s].propagator.getNoradID();
        warn("Satellite {} ({}) excluded from the analysis: {}", noradID, satellites[s].name, message);
        result.diagnostics.push_back({DiagnosticKind::PropagationFailure, std::to_string(noradID), message});
    }

    // ========================================================================
    // Download assignment and aggregation per target
    // ========================================================================

    const DownloadPolicy downloadPolicy = config.downloadPolicy();
    const DeliveryPolicy deliveryPolicy{
        .finalTime = window.end,
        .processingDelay = config.getProcessingDelay(),
        .weightByClearSky = config.getWeightByClearSky()
    };

    for (size_t t = 0; t < targets.size(); t++) {
        const Target &target = targets[t];

        auto missing = std::ranges::find_if(imagesByTarget[t], [&failed](const ImageScan &scan) {
            return scan.missingWeather.has_value() && !failed.contains(scan.satellite);
        });
        if (missing != imagesByTarget[t].end()) {
            warn("Target {} skipped: {}", target.name, *missing->missingWeather);
            result.diagnostics.push_back({DiagnosticKind::MissingWeatherData, target.name,
                                          *missing->missingWeather});
            continue;
        }

        std::vector<double> failures;
        for (const auto &scan : imagesByTarget[t]) {
            if (failed.contains(scan.satellite)) {
                continue;
            }
            for (const auto &image : scan.images) {
                auto assignment = assignDownloads(image.contact.end, downloads[scan.satellite],
                                                  downloadPolicy, config.getDownloadTable());
                failures.push_back(imageFailureProbability(image, assignment, deliveryPolicy));
            }
        }

        double probability = deliveryProbability(failures);
        result.probabilities[target.name] = probability;

        if (failures.empty()) {
            warn("Target {} has no admissible images", target.name);
            result.diagnostics.push_back({DiagnosticKind::NoCoverage, target.name,
                                          "No admissible images in the analysis window"});
        }
        info("Target {}: {} admissible images, delivery probability {:.4f}",
             target.name, failures.size(), probability);
    }

    return result;
}

}
