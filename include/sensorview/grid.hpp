/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_GRID_HPP
#define __SENSORVIEW_GRID_HPP

#include <sensorview/math.hpp>

#include <string>
#include <vector>

namespace sensorview {

struct GridOptions {
    double raSpacingHours;          ///< Meridian spacing (1h = 15°)
    double decSpacingDegrees;       ///< Parallel spacing
    double radius;                  ///< Celestial sphere radius (m)
    double referenceJulianDate;     ///< Instant used for the inertial -> Earth-fixed rotation
    int samplesPerLine = 180;
};

/**
 * Text anchored to a point on the celestial sphere.
 */
struct GridLabel {
    std::string text;
    Vec3 position;
};

/**
 * Right ascension / declination reference grid, already rotated into the
 * Earth-fixed frame.
 */
struct CelestialGrid {
    std::vector<std::vector<Vec3>> raLines;     ///< Meridians, south pole to north pole
    std::vector<std::vector<Vec3>> decLines;    ///< Parallels, closed circles
    std::vector<GridLabel> labels;
};

/**
 * Generates the celestial grid.
 *
 * Parallels are drawn at dec = -90 + k * decSpacing for every k >= 1 with
 * dec < 90; the poles are degenerate and skipped. Meridians are drawn at
 * ra = k * 15 * raSpacing for every k >= 0 with ra < 360. Each line has
 * samplesPerLine + 1 points. A non-positive spacing yields no lines of that
 * family.
 *
 * Labels: "<h>h" on the celestial equator for every meridian, and a signed
 * declination ("+30°", "0°", "-15°") on the RA = 0 meridian for every parallel.
 */
CelestialGrid generateGrid(const GridOptions &options);

}

#endif
