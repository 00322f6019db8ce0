/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_FOOTPRINT_HPP
#define __SENSORVIEW_FOOTPRINT_HPP

#include <sensorview/ellipsoid.hpp>
#include <sensorview/math.hpp>

#include <array>
#include <optional>
#include <vector>

namespace sensorview {

// ============================================================================
// Cone Geometry
// ============================================================================

/**
 * Orthonormal frame around a cone axis.
 */
struct ConeBasis {
    Vec3 axis;    ///< Cone axis (unit)
    Vec3 perp1;   ///< First perpendicular, azimuth 0
    Vec3 perp2;   ///< Second perpendicular, azimuth π/2
};

/**
 * Builds an orthonormal basis around `axis`.
 *
 * perp1 is axis × UNIT_Z, or axis × UNIT_X when the axis is within
 * `parallelThreshold` (cross product magnitude) of the Z axis.
 * perp2 is axis × perp1.
 */
ConeBasis makeConeBasis(const Vec3 &axis, double parallelThreshold = 0.01);

/**
 * Unit direction on the surface of a cone with the given half angle, at
 * `azimuth` radians measured from perp1 towards perp2.
 */
Vec3 coneDirection(const ConeBasis &basis, double halfAngleInRadians, double azimuth);

/**
 * Sensor boresight (+Z of the sensor frame) in the frame of `orientation`.
 */
Vec3 boresight(const Quaternion &orientation);

// ============================================================================
// FOV Footprint
// ============================================================================

struct FootprintOptions {
    int baseRayCount = 36;          ///< Rays sampled evenly around the cone
    double offsetMeters = 100.0;    ///< Lift above the surface along the normal
    int subdivisionRays = 10;       ///< Extra rays per hit/miss transition
};

/**
 * Computes the ground footprint of a circular field of view.
 *
 * Rays are cast around the cone at the half angle. When every ray hits the
 * body the ring is returned closed (first point repeated, baseRayCount + 1
 * points); when none hit the result is empty. When the cone straddles the
 * horizon, each hit/miss transition gets `subdivisionRays` extra rays in one
 * refinement pass, and the surviving hits are returned sorted by azimuth.
 *
 * Every point is lifted `offsetMeters` along the local surface normal.
 *
 * @param apex Cone apex (sensor position, Earth-fixed, m)
 * @param coneAxis Boresight direction (unit)
 * @param halfAngleDegrees Half of the full field of view
 */
std::vector<Vec3> computeFootprint(const Vec3 &apex, const Vec3 &coneAxis,
                                   double halfAngleDegrees,
                                   const Ellipsoid &ellipsoid = Ellipsoid::wgs84(),
                                   const FootprintOptions &options = {});

/**
 * Footprint of a sensor whose world orientation is given as a quaternion;
 * the cone axis is the orientation's +Z axis.
 */
std::vector<Vec3> computeSensorFootprint(const Vec3 &position, const Quaternion &worldOrientation,
                                         double halfAngleDegrees,
                                         const Ellipsoid &ellipsoid = Ellipsoid::wgs84(),
                                         const FootprintOptions &options = {});

/**
 * Ground point hit by the +Z axis of `orientation`, if any.
 */
std::optional<Vec3> computeBoresightIntersection(const Vec3 &position, const Quaternion &orientation,
                                                 const Ellipsoid &ellipsoid = Ellipsoid::wgs84());

/**
 * A straight line segment.
 */
struct LineSegment {
    Vec3 start;
    Vec3 end;
};

/**
 * Body X, Y and Z axes drawn from `position`, each `length` meters long.
 */
std::array<LineSegment, 3> computeBodyAxes(const Vec3 &position, const Quaternion &orientation,
                                           double length);

/**
 * Body axes from an already computed attitude matrix (columns are the body
 * X, Y and Z axes in the world frame).
 */
std::array<LineSegment, 3> computeBodyAxes(const Vec3 &position, const Mat3 &rotation,
                                           double length);

// ============================================================================
// Celestial Projection
// ============================================================================

/**
 * Radius used for the celestial sphere: 100 times the WGS84 maximum radius.
 */
double celestialSphereRadius();

/**
 * Projects a field of view onto a sphere of radius `sphereRadius` centered on
 * the apex. Always returns exactly `numSamples` points, evenly spaced in
 * azimuth.
 */
std::vector<Vec3> computeCelestialProjection(const Vec3 &apex, const Vec3 &coneAxis,
                                             double halfAngleDegrees, double sphereRadius,
                                             int numSamples = 36);

}

#endif
