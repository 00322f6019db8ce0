/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/cone.hpp>

#include <cmath>
#include <cstddef>
#include <utility>

namespace sensorview {

namespace {

// Points on the rim circle, `count` of them starting at azimuth 0
std::vector<Vec3> rimPoints(const Vec3 &apex, const Vec3 &direction,
                            double halfAngleDegrees, double length, int count,
                            double &rimRadius) {
    const ConeBasis basis = makeConeBasis(direction);
    rimRadius = length * std::tan(halfAngleDegrees * DEGREES_TO_RADIANS);
    const Vec3 rimCenter = apex + basis.axis * length;

    std::vector<Vec3> points;
    if (count <= 0) {
        return points;
    }
    points.reserve(count);
    for (int i = 0; i < count; ++i) {
        double angle = (static_cast<double>(i) / count) * TWO_PI;
        Vec3 offset = basis.perp1 * (std::cos(angle) * rimRadius)
                    + basis.perp2 * (std::sin(angle) * rimRadius);
        points.push_back(rimCenter + offset);
    }
    return points;
}

}

std::vector<Vec3> ConeWireframe::positions() const {
    std::vector<Vec3> result;
    result.reserve(spokes.size() * 2 + rim.size());
    for (const auto &spoke : spokes) {
        result.push_back(spoke.start);
        result.push_back(spoke.end);
    }
    result.insert(result.end(), rim.begin(), rim.end());
    return result;
}

ConeWireframe generateConeWireframe(const Vec3 &apex, const Vec3 &direction,
                                    double halfAngleDegrees, double length,
                                    int segments) {
    ConeWireframe cone{};
    std::vector<Vec3> points = rimPoints(apex, direction, halfAngleDegrees, length,
                                         segments, cone.rimRadius);
    if (points.empty()) {
        return cone;
    }
    points.push_back(points.front());

    cone.spokes.reserve(points.size());
    for (const auto &p : points) {
        cone.spokes.push_back({apex, p});
    }
    cone.rim = std::move(points);
    return cone;
}

SolidCone generateSolidCone(const Vec3 &apex, const Vec3 &direction,
                            double halfAngleDegrees, double length,
                            int segments) {
    SolidCone cone{};
    std::vector<Vec3> points = rimPoints(apex, direction, halfAngleDegrees, length,
                                         segments, cone.rimRadius);

    cone.triangles.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        cone.triangles.push_back({apex, points[i], points[(i + 1) % points.size()]});
    }
    return cone;
}

}
