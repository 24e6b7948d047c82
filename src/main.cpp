/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satdeliver.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using spdlog::error;
using spdlog::info;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Program entry point */
int main(int argc, char* argv[]) {
    using namespace std::chrono;

    spdlog::set_default_logger(spdlog::stderr_color_mt("satdeliver"));
    spdlog::set_level(spdlog::level::info);

    satdeliver::Config config;

    std::string tleFilename;
    std::string gatewaysFilename;
    std::string targetsFilename;
    std::string weatherDir;
    std::string finalTime;
    std::string cloudSample;
    std::string outputFormat = "json";
    std::vector<std::string> downloadWeights;
    std::vector<std::string> platforms;

    auto configFile = expandTilde("~/.satdeliver.toml");

    CLI::App app{"SatDeliver - probability of timely delivery of satellite imagery"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    // Inputs
    app.add_option("--tle", tleFilename, "TLE file with one or more element sets per satellite")
        ->required()->check(CLI::ExistingFile);
    app.add_option("--gateways", gatewaysFilename,
        "Gateway CSV: name,latitude_deg,longitude_deg,altitude_m,elevation_mask_deg")
        ->required()->check(CLI::ExistingFile);
    app.add_option("--targets", targetsFilename,
        "Target CSV: name,latitude_deg,longitude_deg,altitude_m,field_of_regard_deg")
        ->required()->check(CLI::ExistingFile);
    app.add_option("--weather", weatherDir,
        "Directory of <target>.csv files with timestamp,cloud_fraction rows")
        ->required()->check(CLI::ExistingDirectory);

    // Analysis window
    app.add_option("--final-time", finalTime, "Delivery deadline (format: YYYY-MM-DD HH:MM:SS UTC)")
        ->required();
    app.add_option_function<double>("--max-age-hours",
        [&config](const double h) { config.setMaxAge(duration_cast<seconds>(duration<double, std::ratio<3600>>(h))); },
        "Length of the analysis window before the deadline, in hours (default 24)");

    // Imaging
    app.add_option_function<double>("--cloud-threshold",
        [&config](const double c) { config.setCloudThreshold(c); },
        "Largest admissible cloud fraction, 0 to 1 (default 1)");
    app.add_option("--cloud-sample", cloudSample,
        "Hour used for an image's cloud fraction: start, midpoint or worst (default midpoint)");
    app.add_flag_function("--clear-sky-weighting",
        [&config](const int64_t v) { config.setWeightByClearSky(v > 0); },
        "Scale acquisition probability by the clear-sky fraction");
    app.add_option("--platform", platforms,
        "Acquisition probability for satellites whose name contains NAME (format: NAME:P, repeatable)");
    app.add_option_function<double>("--acquisition-probability",
        [&config](const double p) { config.setDefaultAcquisitionProbability(p); },
        "Acquisition probability for satellites no --platform matches (default 1)");

    // Downloads
    app.add_option_function<double>("--t-min-minutes",
        [&config](const double m) { config.setMinDownloadDelay(duration_cast<seconds>(duration<double, std::ratio<60>>(m))); },
        "Earliest download after capture, in minutes (default 60)");
    app.add_option_function<double>("--t-max-minutes",
        [&config](const double m) { config.setMaxDownloadDelay(duration_cast<seconds>(duration<double, std::ratio<60>>(m))); },
        "Latest download after capture, in minutes (default 360)");
    app.add_option_function<int>("--download-freq",
        [&config](const int k) { config.setDownloadFrequency(k); },
        "Only every Nth gateway pass of a satellite carries downloads (default 8)");
    app.add_option_function<int>("--max-downloads",
        [&config](const int n) { config.setMaxDownloadsConsidered(n); },
        "Download passes considered per image (default 2)");
    app.add_option("--download-weights", downloadWeights,
        "Probability of each download pass being used when N are available "
        "(format: N:w1,w2,..., repeatable, replaces the default table)");
    app.add_option_function<double>("--processing-delay-minutes",
        [&config](const double m) { config.setProcessingDelay(duration_cast<seconds>(duration<double, std::ratio<60>>(m))); },
        "Time from download to delivered product, in minutes (default 0)");

    // Numerics
    app.add_option_function<int>("--step-seconds",
        [&config](const int s) { config.setScanStep(seconds(s)); },
        "Contact scan step in seconds (default 30)");
    app.add_option_function<int>("--tolerance-seconds",
        [&config](const int s) { config.setRefinementTolerance(seconds(s)); },
        "Precision of contact start and end times in seconds (default 1)");
    app.add_option_function<double>("--max-element-age-days",
        [&config](const double d) { config.setMaxElementAge(duration_cast<seconds>(duration<double, std::ratio<86400>>(d))); },
        "Refuse to propagate further than this from an element's epoch, in days (default 14)");
    app.add_option_function<unsigned int>("--threads",
        [&config](const unsigned int t) { config.setThreads(t); },
        "Worker threads, 0 for one per CPU (default 0)");

    // Output
    app.add_option("--format", outputFormat, "Output format: json or table (default json)")
        ->check(CLI::IsMember({"json", "table"}));
    app.add_flag_function("-v,--verbose",
        [](const int64_t v) { if (v > 0) spdlog::set_level(spdlog::level::debug); },
        "Display debugging information");

    app.final_callback([&]() {
        try {
            config.setFinalTime(satdeliver::parseTimestamp(finalTime));
            if (!cloudSample.empty()) {
                config.setCloudSamplePolicy(satdeliver::parseCloudSamplePolicy(cloudSample));
            }
            if (!downloadWeights.empty()) {
                satdeliver::DownloadTable table;
                for (const auto &entry : downloadWeights) {
                    auto [n, weights] = satdeliver::parseDownloadWeights(entry);
                    table.set(n, std::move(weights));
                }
                config.setDownloadTable(std::move(table));
            }
            for (const auto &entry : platforms) {
                config.addPlatform(satdeliver::parsePlatform(entry));
            }
            config.validate();

            satdeliver::ElementCatalog catalog;
            satdeliver::loadElementCatalog(tleFilename, catalog);
            auto gateways = satdeliver::loadGateways(gatewaysFilename);
            auto targets = satdeliver::loadTargets(targetsFilename, weatherDir);

            satdeliver::DeliveryEngine engine(config, std::move(catalog), std::move(gateways), std::move(targets));
            auto result = engine.run();

            if (outputFormat == "table") {
                satdeliver::printTable(result, std::cout);
            } else {
                satdeliver::writeJSON(result, std::cout);
            }
            info("Done.");
        } catch (const satdeliver::ConfigurationError &err) {
            error("Configuration error: {}", err.what());
            std::exit(1);
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    app.ignore_case();

    CLI11_PARSE(app, argc, argv);

    return 0;
}
