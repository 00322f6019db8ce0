/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

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

/** Parse a --time argument into the configuration */
void setTimeOption(sensorview::Config &config, const std::string &timeStr) {
    try {
        config.setTime(sensorview::parseTimestamp(timeStr));
    } catch (const std::invalid_argument &e) {
        throw CLI::ValidationError("--time", e.what());
    }
}

/** Print ellipsoid parameters for the ellipsoid command */
void printEllipsoid(const sensorview::EllipsoidParameters &ellipsoid, double sigmaScale) {
    const auto &r = ellipsoid.radii;
    const auto &q = ellipsoid.orientation;
    std::cout << std::format("Sigma Scale: {:.2f}", sigmaScale) << std::endl;
    std::cout << std::format("Radii:       {:12.3f} {:12.3f} {:12.3f} m", r.x, r.y, r.z) << std::endl;
    std::cout << std::format("Orientation: {:9.6f} {:9.6f} {:9.6f} {:9.6f} (x y z w)", q.x, q.y, q.z, q.w) << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    // Logs go to stderr so JSON on stdout stays clean
    spdlog::set_default_logger(spdlog::stderr_color_mt("sensorview"));
    spdlog::set_level(spdlog::level::warn);

    sensorview::Config config;
    config.setVerbose(false);

    auto configFile = expandTilde("~/.sensorview.toml");

    CLI::App app{"SensorView"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::warn);
        },
        "Display debugging information");
    app.add_option_function<std::string>("--coordinates",
        [&config](const std::string &type) {
            try {
                config.setCoordinatesType(sensorview::parseCoordinatesType(type));
            } catch (const std::invalid_argument &e) {
                throw CLI::ValidationError("--coordinates", e.what());
            }
        },
        "Position columns when the scenario does not say: Geodetic, CartesianFixed or CartesianInertial (default Geodetic)");
    app.add_option_function<std::string>("--interpolation",
        [&config](const std::string &mode) {
            if (mode == "linear") {
                config.setInterpolation(sensorview::OrientationInterpolation::Linear);
            } else if (mode == "slerp") {
                config.setInterpolation(sensorview::OrientationInterpolation::Spherical);
            } else {
                throw CLI::ValidationError("--interpolation", "expected linear or slerp: " + mode);
            }
        },
        "Attitude interpolation: slerp or linear (default slerp)");
    app.add_option_function<double>("--sigma",
        [&config](const double s) { config.setSigmaScale(s); },
        "Uncertainty ellipsoid sigma scale (default 1, range 0.1 - 10)");
    app.add_option_function<std::string>("--quality",
        [&config](const std::string &q) { config.setUncertaintyQuality(sensorview::parseUncertaintyQuality(q)); },
        "Uncertainty data quality: High, Medium or Low (default Medium)");
    app.add_option_function<int>("--rays",
        [&config](const int rays) { config.setFootprintRays(rays); },
        "Rays cast around each sensor cone (default 36)");
    app.add_option_function<int>("--subdivisions",
        [&config](const int rays) { config.setSubdivisionRays(rays); },
        "Extra rays at each horizon crossing (default 10)");
    app.add_option_function<double>("--offset",
        [&config](const double m) { config.setFootprintOffset(m); },
        "Footprint lift above the surface in meters (default 100)");
    app.add_option_function<double>("--cone-length",
        [&config](const double m) { config.setConeLength(m); },
        "Sensor cone length in meters (default 50000)");
    app.add_option_function<double>("--axis-length",
        [&config](const double m) { config.setAxisLength(m); },
        "Body axis length in meters (default 50000)");
    app.add_option_function<double>("--radius",
        [&config](const double m) { config.setCelestialRadius(m); },
        "Celestial sphere radius in meters (default 100 Earth radii)");
    app.add_option_function<double>("--ra",
        [&config](const double hours) { config.setRASpacing(hours); },
        "Right ascension grid spacing in hours (default 2, range 1 - 6)");
    app.add_option_function<double>("--dec",
        [&config](const double degrees) { config.setDecSpacing(degrees); },
        "Declination grid spacing in degrees (default 15, range 10 - 30)");
    app.add_option_function<int>("--grid-samples",
        [&config](const int samples) { config.setGridSamples(samples); },
        "Points per grid line (default 180)");

    app.ignore_case();
    app.fallthrough();

    // info command - summarize a scenario
    auto infoCommand = app.add_subcommand("info", "Summarize the satellites in a scenario file");
    std::string infoFile;
    infoCommand->add_option("scenario", infoFile, "Scenario file (JSON)")->required();

    // snapshot command - evaluate a scenario at one instant
    auto snapshotCommand = app.add_subcommand("snapshot", "Evaluate a scenario at one instant and print the geometry as JSON");
    std::string snapshotFile;
    snapshotCommand->add_option("scenario", snapshotFile, "Scenario file (JSON)")->required();
    snapshotCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { setTimeOption(config, timeStr); },
        "Time to evaluate (format: YYYY-MM-DD HH:MM:SS UTC, default: start of the first satellite's data)");
    snapshotCommand->add_flag_function("--grid",
        [&config](const int64_t g) { config.setShowGrid(g > 0); },
        "Include the RA/Dec celestial grid");

    // grid command - celestial grid only
    auto gridCommand = app.add_subcommand("grid", "Generate the RA/Dec celestial grid as JSON");
    gridCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { setTimeOption(config, timeStr); },
        "Reference time for the Earth rotation (format: YYYY-MM-DD HH:MM:SS UTC, default: now)");

    // ellipsoid command - covariance to ellipsoid
    auto ellipsoidCommand = app.add_subcommand("ellipsoid", "Convert a position covariance matrix to an uncertainty ellipsoid");
    sensorview::CovarianceMatrix covariance{0.0, 0.0, 0.0};
    ellipsoidCommand->add_option("--xx", covariance.xx, "Variance in X (m^2)")->required();
    ellipsoidCommand->add_option("--yy", covariance.yy, "Variance in Y (m^2)")->required();
    ellipsoidCommand->add_option("--zz", covariance.zz, "Variance in Z (m^2)")->required();
    ellipsoidCommand->add_option("--xy", covariance.xy, "Covariance X-Y (m^2)");
    ellipsoidCommand->add_option("--xz", covariance.xz, "Covariance X-Z (m^2)");
    ellipsoidCommand->add_option("--yz", covariance.yz, "Covariance Y-Z (m^2)");

    // Command callbacks

    infoCommand->final_callback([&config, &infoFile](void) {
        try {
            auto scenario = sensorview::loadScenario(infoFile, config.getCoordinatesType());
            std::cout << "Coordinates: " << scenario.coordinates << std::endl;
            std::cout << "Satellites: " << scenario.satellites.size() << std::endl;
            std::cout << "Ground Stations: " << scenario.groundStations.size() << std::endl;
            std::cout << std::endl;
            for (const auto &satellite : scenario.satellites) {
                satellite.printInfo(std::cout);
            }
            for (const auto &station : scenario.groundStations) {
                std::cout << std::format("{} ({}): {:.4f}, {:.4f}, {:.1f} m",
                    station.name, station.id, station.latitudeInDegrees,
                    station.longitudeInDegrees, station.altitudeInMeters) << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    snapshotCommand->final_callback([&config, &snapshotFile](void) {
        try {
            auto scenario = sensorview::loadScenario(snapshotFile, config.getCoordinatesType());

            double julianDate;
            if (config.hasTime()) {
                julianDate = sensorview::toJulianDate(config.getTime());
            } else {
                std::optional<double> start;
                for (const auto &satellite : scenario.satellites) {
                    if (auto span = satellite.getAvailability()) {
                        if (!start || span->first < *start) {
                            start = span->first;
                        }
                    }
                }
                julianDate = start.value_or(sensorview::toJulianDate(config.getTime()));
            }

            spdlog::debug("Evaluating scene at {}", sensorview::formatJulianDate(julianDate));
            auto snapshot = sensorview::evaluateScene(scenario, julianDate, config);
            sensorview::writeSnapshot(std::cout, snapshot);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    gridCommand->final_callback([&config](void) {
        try {
            double julianDate = sensorview::toJulianDate(config.getTime());
            auto grid = sensorview::generateGrid({
                .raSpacingHours = config.getRASpacing(),
                .decSpacingDegrees = config.getDecSpacing(),
                .radius = config.getCelestialRadius(),
                .referenceJulianDate = julianDate,
                .samplesPerLine = config.getGridSamples()
            });
            spdlog::debug("Generated {} RA and {} Dec lines", grid.raLines.size(), grid.decLines.size());
            sensorview::writeGrid(std::cout, grid);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    ellipsoidCommand->final_callback([&config, &covariance](void) {
        try {
            auto ellipsoid = sensorview::covarianceToEllipsoid(covariance, config.getSigmaScale());
            printEllipsoid(ellipsoid, config.getSigmaScale());
            std::cout << std::format("Opacity:     {:.1f} ({})",
                sensorview::opacityForQuality(config.getUncertaintyQuality()),
                sensorview::toString(config.getUncertaintyQuality())) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
