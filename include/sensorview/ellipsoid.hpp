/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_ELLIPSOID_HPP
#define __SENSORVIEW_ELLIPSOID_HPP

#include <sensorview/math.hpp>

#include <optional>

namespace sensorview {

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378137.0;                  // Semi-major axis (m) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;        // Flattening
constexpr double WGS84_B = WGS84_A * (1.0 - WGS84_F);  // Semi-minor axis (m) - polar radius

/**
 * Geodetic coordinates representing a position on or above the reference body.
 */
struct Geodetic {
    double latInRadians;      ///< Geodetic latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;      ///< Longitude (-π to +π, positive = East)
    double altInMeters;       ///< Height above the ellipsoid surface
};

/**
 * Triaxial reference ellipsoid centered at the origin of the Earth-fixed frame.
 */
struct Ellipsoid {
    Vec3 radii;

    /** The WGS84 Earth ellipsoid. */
    static constexpr Ellipsoid wgs84() {
        return Ellipsoid{{WGS84_A, WGS84_A, WGS84_B}};
    }

    double maximumRadius() const;

    /**
     * Outward unit normal of the ellipsoid at (or near) a surface point.
     */
    Vec3 geodeticSurfaceNormal(const Vec3 &point) const;

    /**
     * Converts geodetic coordinates to Earth-fixed Cartesian coordinates.
     *
     * Uses the radius of curvature in the prime vertical:
     *   N = a / sqrt(1 - e² sin²(lat))
     * The (1 - e²) factor in Z accounts for the polar flattening.
     */
    Vec3 geodeticToCartesian(const Geodetic &geodetic) const;

    /**
     * Converts Earth-fixed Cartesian coordinates to geodetic coordinates
     * (Bowring's iterative method).
     */
    Geodetic cartesianToGeodetic(const Vec3 &point) const;
};

/**
 * Casts a ray from `origin` along `direction` and returns the first point
 * where it enters the ellipsoid.
 *
 * Only the forward half of the ray is considered. The origin is expected to
 * be outside the body (typically above the surface); origins inside the body
 * are not supported.
 *
 * @param origin Ray start in the Earth-fixed frame (m)
 * @param direction Ray direction (unit length)
 * @param ellipsoid Reference body
 * @return The near intersection point, or std::nullopt if the ray misses
 */
std::optional<Vec3> intersect(const Vec3 &origin, const Vec3 &direction,
                              const Ellipsoid &ellipsoid);

}

#endif
