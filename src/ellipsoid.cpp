/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/ellipsoid.hpp>

#include <algorithm>
#include <cmath>

namespace sensorview {

double Ellipsoid::maximumRadius() const {
    return std::max({radii.x, radii.y, radii.z});
}

Vec3 Ellipsoid::geodeticSurfaceNormal(const Vec3 &point) const {
    Vec3 n{
        point.x / (radii.x * radii.x),
        point.y / (radii.y * radii.y),
        point.z / (radii.z * radii.z)
    };
    return n.normalize();
}

// Eccentricity squared of the meridian section (x radius vs. z radius)
static double eccentricitySquared(const Ellipsoid &e) {
    double a = e.radii.x;
    double b = e.radii.z;
    return 1.0 - (b * b) / (a * a);
}

Vec3 Ellipsoid::geodeticToCartesian(const Geodetic &geodetic) const {
    double a = radii.x;
    double e2 = eccentricitySquared(*this);

    double sinLat = std::sin(geodetic.latInRadians);
    double cosLat = std::cos(geodetic.latInRadians);
    double sinLon = std::sin(geodetic.lonInRadians);
    double cosLon = std::cos(geodetic.lonInRadians);

    // Radius of curvature in the prime vertical
    double N = a / std::sqrt(1.0 - e2 * sinLat * sinLat);

    return {
        (N + geodetic.altInMeters) * cosLat * cosLon,
        (N + geodetic.altInMeters) * cosLat * sinLon,
        (N * (1.0 - e2) + geodetic.altInMeters) * sinLat
    };
}

Geodetic Ellipsoid::cartesianToGeodetic(const Vec3 &point) const {
    double a = radii.x;
    double e2 = eccentricitySquared(*this);

    double x = point.x, y = point.y, z = point.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    double lat = std::atan2(z, p * (1 - e2));  // initial guess
    for (int i = 0; i < 10; ++i) {
        double sinLat = std::sin(lat);
        double N = a / std::sqrt(1 - e2 * sinLat * sinLat);
        lat = std::atan2(z + e2 * N * sinLat, p);
    }

    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double N = a / std::sqrt(1 - e2 * sinLat * sinLat);

    double alt;
    if (std::abs(cosLat) > 1e-10) {
        alt = p / cosLat - N;
    } else {
        // On the polar axis
        alt = std::abs(z) - radii.z;
    }

    return {lat, lon, alt};
}

std::optional<Vec3> intersect(const Vec3 &origin, const Vec3 &direction,
                              const Ellipsoid &ellipsoid) {
    // Scale space so the ellipsoid becomes the unit sphere:
    //   |O' + t D'|² = 1  with  O' = O / r, D' = D / r (componentwise)
    const Vec3 &r = ellipsoid.radii;
    Vec3 o{origin.x / r.x, origin.y / r.y, origin.z / r.z};
    Vec3 d{direction.x / r.x, direction.y / r.y, direction.z / r.z};

    double a = d.dot(d);
    double b = 2.0 * o.dot(d);
    double c = o.dot(o) - 1.0;

    if (a == 0.0) {
        return std::nullopt;
    }

    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0.0) {
        return std::nullopt;
    }

    double sqrtDisc = std::sqrt(discriminant);
    double t1 = (-b - sqrtDisc) / (2.0 * a);
    double t2 = (-b + sqrtDisc) / (2.0 * a);

    // Nearest forward intersection
    double t = (t1 >= 0.0) ? t1 : t2;
    if (t < 0.0) {
        return std::nullopt;
    }

    return origin + direction * t;
}

}
