/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/grid.hpp>
#include <sensorview/frames.hpp>

#include <cmath>
#include <format>
#include <utility>

namespace sensorview {

// Tolerance for the open upper bounds of the RA/Dec loops
constexpr double GRID_EPSILON = 1e-9;

namespace {

Vec3 sphericalToCartesian(double raInRadians, double decInRadians, double radius) {
    return {
        radius * std::cos(decInRadians) * std::cos(raInRadians),
        radius * std::cos(decInRadians) * std::sin(raInRadians),
        radius * std::sin(decInRadians)
    };
}

std::string declinationLabel(double dec) {
    if (std::abs(dec) < GRID_EPSILON) {
        return "0°";
    }
    if (dec > 0.0) {
        return std::format("+{:g}°", dec);
    }
    return std::format("{:g}°", dec);
}

}

CelestialGrid generateGrid(const GridOptions &options) {
    CelestialGrid grid;
    const Mat3 toFixed = inertialToEarthFixed(options.referenceJulianDate);
    const int samples = options.samplesPerLine > 0 ? options.samplesPerLine : 1;
    const double radius = options.radius;

    // Declination parallels
    if (options.decSpacingDegrees > 0.0) {
        for (int k = 1; ; ++k) {
            double dec = -90.0 + k * options.decSpacingDegrees;
            if (dec >= 90.0 - GRID_EPSILON) {
                break;
            }
            double decRad = dec * DEGREES_TO_RADIANS;

            std::vector<Vec3> line;
            line.reserve(samples + 1);
            for (int i = 0; i <= samples; ++i) {
                double ra = (static_cast<double>(i) / samples) * TWO_PI;
                line.push_back(toFixed * sphericalToCartesian(ra, decRad, radius));
            }
            grid.decLines.push_back(std::move(line));
            grid.labels.push_back({declinationLabel(dec),
                                   toFixed * sphericalToCartesian(0.0, decRad, radius)});
        }
    }

    // Right ascension meridians
    if (options.raSpacingHours > 0.0) {
        const double raSpacingDegrees = options.raSpacingHours * 15.0;
        for (int k = 0; ; ++k) {
            double ra = k * raSpacingDegrees;
            if (ra >= 360.0 - GRID_EPSILON) {
                break;
            }
            double raRad = ra * DEGREES_TO_RADIANS;

            std::vector<Vec3> line;
            line.reserve(samples + 1);
            for (int i = 0; i <= samples; ++i) {
                double dec = -90.0 + (static_cast<double>(i) / samples) * 180.0;
                line.push_back(toFixed * sphericalToCartesian(raRad, dec * DEGREES_TO_RADIANS, radius));
            }
            grid.raLines.push_back(std::move(line));
            grid.labels.push_back({std::format("{:g}h", ra / 15.0),
                                   toFixed * sphericalToCartesian(raRad, 0.0, radius)});
        }
    }

    return grid;
}

}
