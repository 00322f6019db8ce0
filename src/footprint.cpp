/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/footprint.hpp>

#include <algorithm>
#include <cmath>

namespace sensorview {

ConeBasis makeConeBasis(const Vec3 &axis, double parallelThreshold) {
    Vec3 unitAxis = axis.normalize();

    Vec3 perp1 = unitAxis.cross(UNIT_Z);
    if (perp1.magnitude() < parallelThreshold) {
        // Axis is (nearly) parallel to Z, use X instead
        perp1 = unitAxis.cross(UNIT_X);
    }
    perp1 = perp1.normalize();
    Vec3 perp2 = unitAxis.cross(perp1).normalize();

    return {unitAxis, perp1, perp2};
}

Vec3 coneDirection(const ConeBasis &basis, double halfAngleInRadians, double azimuth) {
    double cosHalf = std::cos(halfAngleInRadians);
    double sinHalf = std::sin(halfAngleInRadians);

    // Circular cross-section of the cone, then the axial component
    Vec3 circleDir = basis.perp1 * (std::cos(azimuth) * sinHalf)
                   + basis.perp2 * (std::sin(azimuth) * sinHalf);
    return (basis.axis * cosHalf + circleDir).normalize();
}

Vec3 boresight(const Quaternion &orientation) {
    return orientation.rotate(UNIT_Z).normalize();
}

// ============================================================================
// FOV Footprint
// ============================================================================

namespace {

struct RayResult {
    double azimuth;
    std::optional<Vec3> point;
};

}

std::vector<Vec3> computeFootprint(const Vec3 &apex, const Vec3 &coneAxis,
                                   double halfAngleDegrees,
                                   const Ellipsoid &ellipsoid,
                                   const FootprintOptions &options) {
    const int numRays = options.baseRayCount;
    if (numRays <= 0) {
        return {};
    }

    const ConeBasis basis = makeConeBasis(coneAxis);
    const double halfAngle = halfAngleDegrees * DEGREES_TO_RADIANS;

    auto castRayAtAngle = [&](double azimuth) -> std::optional<Vec3> {
        Vec3 direction = coneDirection(basis, halfAngle, azimuth);
        auto ground = intersect(apex, direction, ellipsoid);
        if (!ground) {
            return std::nullopt;
        }
        // Lift above the surface to avoid z-fighting with terrain
        return *ground + ellipsoid.geodeticSurfaceNormal(*ground) * options.offsetMeters;
    };

    // First pass: evenly spaced rays
    std::vector<RayResult> initial;
    initial.reserve(numRays);
    for (int i = 0; i < numRays; ++i) {
        double azimuth = (static_cast<double>(i) / numRays) * TWO_PI;
        initial.push_back({azimuth, castRayAtAngle(azimuth)});
    }

    auto hitCount = std::count_if(initial.begin(), initial.end(),
        [](const RayResult &r) { return r.point.has_value(); });

    if (hitCount == 0) {
        return {};
    }

    if (hitCount == numRays) {
        std::vector<Vec3> ring;
        ring.reserve(numRays + 1);
        for (const auto &r : initial) {
            ring.push_back(*r.point);
        }
        ring.push_back(ring.front());
        return ring;
    }

    // Partial footprint: refine every hit/miss transition once
    std::vector<RayResult> refined;
    for (int i = 0; i < numRays; ++i) {
        const auto &current = initial[i];
        const auto &next = initial[(i + 1) % numRays];

        if (current.point) {
            refined.push_back(current);
        }

        if (current.point.has_value() == next.point.has_value()) {
            continue;
        }

        double delta = next.azimuth - current.azimuth;
        if (delta < 0.0) {
            delta += TWO_PI;
        }

        for (int j = 1; j <= options.subdivisionRays; ++j) {
            double t = static_cast<double>(j) / (options.subdivisionRays + 1);
            double azimuth = current.azimuth + t * delta;
            if (auto point = castRayAtAngle(azimuth)) {
                refined.push_back({azimuth, point});
            }
        }
    }

    std::stable_sort(refined.begin(), refined.end(),
        [](const RayResult &a, const RayResult &b) { return a.azimuth < b.azimuth; });

    std::vector<Vec3> boundary;
    boundary.reserve(refined.size());
    for (const auto &r : refined) {
        boundary.push_back(*r.point);
    }
    return boundary;
}

std::vector<Vec3> computeSensorFootprint(const Vec3 &position, const Quaternion &worldOrientation,
                                         double halfAngleDegrees,
                                         const Ellipsoid &ellipsoid,
                                         const FootprintOptions &options) {
    return computeFootprint(position, boresight(worldOrientation), halfAngleDegrees,
                            ellipsoid, options);
}

std::optional<Vec3> computeBoresightIntersection(const Vec3 &position, const Quaternion &orientation,
                                                 const Ellipsoid &ellipsoid) {
    return intersect(position, boresight(orientation), ellipsoid);
}

std::array<LineSegment, 3> computeBodyAxes(const Vec3 &position, const Quaternion &orientation,
                                           double length) {
    return computeBodyAxes(position, orientation.toRotationMatrix(), length);
}

std::array<LineSegment, 3> computeBodyAxes(const Vec3 &position, const Mat3 &rotation,
                                           double length) {
    return {{
        {position, position + rotation.column(0) * length},
        {position, position + rotation.column(1) * length},
        {position, position + rotation.column(2) * length}
    }};
}

// ============================================================================
// Celestial Projection
// ============================================================================

double celestialSphereRadius() {
    return Ellipsoid::wgs84().maximumRadius() * 100.0;
}

std::vector<Vec3> computeCelestialProjection(const Vec3 &apex, const Vec3 &coneAxis,
                                             double halfAngleDegrees, double sphereRadius,
                                             int numSamples) {
    std::vector<Vec3> points;
    if (numSamples <= 0) {
        return points;
    }

    const ConeBasis basis = makeConeBasis(coneAxis);
    const double halfAngle = halfAngleDegrees * DEGREES_TO_RADIANS;

    points.reserve(numSamples);
    for (int i = 0; i < numSamples; ++i) {
        double azimuth = (static_cast<double>(i) / numSamples) * TWO_PI;
        points.push_back(apex + coneDirection(basis, halfAngle, azimuth) * sphereRadius);
    }
    return points;
}

}
