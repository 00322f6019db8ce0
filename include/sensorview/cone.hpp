/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_CONE_HPP
#define __SENSORVIEW_CONE_HPP

#include <sensorview/footprint.hpp>
#include <sensorview/math.hpp>

#include <vector>

namespace sensorview {

/**
 * Line representation of a sensor cone: spokes from the apex to the rim,
 * plus the rim itself as a closed polyline.
 */
struct ConeWireframe {
    double rimRadius;
    std::vector<LineSegment> spokes;    ///< segments + 1 apex-to-rim lines
    std::vector<Vec3> rim;              ///< segments + 1 points, first == last

    /** Flattened start/end pairs of all spokes followed by the rim polyline. */
    std::vector<Vec3> positions() const;
};

struct Triangle {
    Vec3 a;
    Vec3 b;
    Vec3 c;
};

/**
 * Triangle fan of a sensor cone. Every triangle starts at the apex.
 */
struct SolidCone {
    double rimRadius;
    std::vector<Triangle> triangles;
};

/**
 * Generates a wireframe cone of the given length along `direction`.
 *
 * @param apex Cone apex (m)
 * @param direction Cone axis (unit)
 * @param halfAngleDegrees Half of the full field of view
 * @param length Distance from the apex to the rim plane (m)
 * @param segments Number of rim subdivisions
 */
ConeWireframe generateConeWireframe(const Vec3 &apex, const Vec3 &direction,
                                    double halfAngleDegrees, double length,
                                    int segments = 16);

/**
 * Generates a solid cone as `segments` triangles
 * (apex, rim[i], rim[(i + 1) mod segments]).
 */
SolidCone generateSolidCone(const Vec3 &apex, const Vec3 &direction,
                            double halfAngleDegrees, double length,
                            int segments = 32);

}

#endif
