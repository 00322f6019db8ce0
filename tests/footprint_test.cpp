/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sensorview/footprint.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace sensorview {
namespace {

void expectVecNear(const Vec3 &actual, const Vec3 &expected, double tolerance = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

double angleBetween(const Vec3 &a, const Vec3 &b) {
    double c = a.normalize().dot(b.normalize());
    return std::acos(std::clamp(c, -1.0, 1.0));
}

// ============================================================================
// Cone basis
// ============================================================================

TEST(ConeBasisTest, Orthonormal) {
    ConeBasis basis = makeConeBasis(Vec3{0.3, -0.8, 0.5});
    EXPECT_NEAR(basis.axis.magnitude(), 1.0, 1e-12);
    EXPECT_NEAR(basis.perp1.magnitude(), 1.0, 1e-12);
    EXPECT_NEAR(basis.perp2.magnitude(), 1.0, 1e-12);
    EXPECT_NEAR(basis.axis.dot(basis.perp1), 0.0, 1e-12);
    EXPECT_NEAR(basis.axis.dot(basis.perp2), 0.0, 1e-12);
    EXPECT_NEAR(basis.perp1.dot(basis.perp2), 0.0, 1e-12);
}

TEST(ConeBasisTest, UsesZReference) {
    ConeBasis basis = makeConeBasis(UNIT_X);
    expectVecNear(basis.perp1, UNIT_X.cross(UNIT_Z));
    expectVecNear(basis.perp2, UNIT_X.cross(UNIT_X.cross(UNIT_Z)));
}

// An axis along Z would give a zero cross product with Z
TEST(ConeBasisTest, FallsBackToXReferenceNearZ) {
    ConeBasis basis = makeConeBasis(UNIT_Z);
    expectVecNear(basis.perp1, UNIT_Y);
    expectVecNear(basis.perp2, -UNIT_X);

    ConeBasis down = makeConeBasis(Vec3{0.001, 0.0, -1.0});
    EXPECT_NEAR(down.perp1.magnitude(), 1.0, 1e-12);
    EXPECT_NEAR(down.axis.dot(down.perp1), 0.0, 1e-12);
}

TEST(ConeBasisTest, DirectionsLieOnCone) {
    ConeBasis basis = makeConeBasis(Vec3{1.0, 2.0, 3.0});
    double halfAngle = 12.0 * DEGREES_TO_RADIANS;
    for (int i = 0; i < 8; ++i) {
        Vec3 d = coneDirection(basis, halfAngle, i * TWO_PI / 8);
        EXPECT_NEAR(d.magnitude(), 1.0, 1e-12);
        EXPECT_NEAR(angleBetween(d, basis.axis), halfAngle, 1e-12);
    }
}

TEST(ConeBasisTest, BoresightIsPlusZ) {
    expectVecNear(boresight(Quaternion::identity()), UNIT_Z);
    Quaternion flipped = Quaternion::fromAxisAngle(UNIT_X, std::numbers::pi);
    expectVecNear(boresight(flipped), -UNIT_Z);
}

// ============================================================================
// Footprint
// ============================================================================

class FootprintTest : public ::testing::Test {
protected:
    Ellipsoid earth = Ellipsoid::wgs84();
    FootprintOptions options;

    // Unit geodetic normal at a latitude/longitude
    static Vec3 localNormal(double lat, double lon) {
        return {std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat)};
    }
};

TEST_F(FootprintTest, StraightDownIsClosedRing) {
    const double lat = 0.5;
    const double lon = 1.0;
    Vec3 apex = earth.geodeticToCartesian({lat, lon, 500000.0});
    Vec3 axis = -localNormal(lat, lon);

    auto footprint = computeFootprint(apex, axis, 5.0, earth, options);

    ASSERT_EQ(footprint.size(), 37u);
    EXPECT_EQ(footprint.front(), footprint.back());

    for (const auto &p : footprint) {
        // Lifted exactly offsetMeters above the surface
        EXPECT_NEAR(earth.cartesianToGeodetic(p).altInMeters, options.offsetMeters, 1e-3);
        // And still (almost) on the cone
        EXPECT_NEAR(angleBetween(p - apex, axis) * RADIANS_TO_DEGREES, 5.0, 0.05);
    }
}

TEST_F(FootprintTest, PointingAwayIsEmpty) {
    Vec3 apex = earth.geodeticToCartesian({0.2, -0.4, 500000.0});
    Vec3 axis = localNormal(0.2, -0.4);
    EXPECT_TRUE(computeFootprint(apex, axis, 5.0, earth, options).empty());
}

TEST_F(FootprintTest, ZeroOffset) {
    options.offsetMeters = 0.0;
    Vec3 apex{WGS84_A + 700000.0, 0.0, 0.0};
    auto footprint = computeFootprint(apex, -UNIT_X, 10.0, earth, options);
    ASSERT_EQ(footprint.size(), 37u);
    for (const auto &p : footprint) {
        EXPECT_NEAR(earth.cartesianToGeodetic(p).altInMeters, 0.0, 1e-3);
    }
}

TEST_F(FootprintTest, RayCountIsConfigurable) {
    options.baseRayCount = 12;
    Vec3 apex{WGS84_A + 700000.0, 0.0, 0.0};
    EXPECT_EQ(computeFootprint(apex, -UNIT_X, 10.0, earth, options).size(), 13u);

    options.baseRayCount = 0;
    EXPECT_TRUE(computeFootprint(apex, -UNIT_X, 10.0, earth, options).empty());
}

// Low apex, axis tilted 89 degrees from nadir: the horizon cuts through the
// cone and only part of the rays reach the ground.
TEST_F(FootprintTest, GrazingHorizonIsRefined) {
    const double altitude = 2000.0;
    const double tilt = 89.0 * DEGREES_TO_RADIANS;
    const double halfAngle = 5.0;

    Vec3 apex = earth.geodeticToCartesian({0.0, 0.0, altitude});
    Vec3 axis{-std::cos(tilt), std::sin(tilt), 0.0};

    // Count the evenly spaced rays that hit on their own
    ConeBasis basis = makeConeBasis(axis);
    int baseHits = 0;
    for (int i = 0; i < options.baseRayCount; ++i) {
        double azimuth = static_cast<double>(i) / options.baseRayCount * TWO_PI;
        if (intersect(apex, coneDirection(basis, halfAngle * DEGREES_TO_RADIANS, azimuth), earth)) {
            ++baseHits;
        }
    }
    ASSERT_GT(baseHits, 0);
    ASSERT_LT(baseHits, options.baseRayCount);

    auto footprint = computeFootprint(apex, axis, halfAngle, earth, options);

    EXPECT_GT(footprint.size(), 0u);
    EXPECT_LT(footprint.size(), static_cast<std::size_t>(options.baseRayCount + 1));
    // Subdivision added hits next to the horizon
    EXPECT_GT(footprint.size(), static_cast<std::size_t>(baseHits));

    for (const auto &p : footprint) {
        EXPECT_NEAR(earth.cartesianToGeodetic(p).altInMeters, options.offsetMeters, 1e-3);
    }
}

TEST_F(FootprintTest, GrazingWithoutSubdivision) {
    options.subdivisionRays = 0;
    Vec3 apex = earth.geodeticToCartesian({0.0, 0.0, 2000.0});
    const double tilt = 89.0 * DEGREES_TO_RADIANS;
    Vec3 axis{-std::cos(tilt), std::sin(tilt), 0.0};

    auto refined = computeFootprint(apex, axis, 5.0, earth, FootprintOptions{});
    auto coarse = computeFootprint(apex, axis, 5.0, earth, options);
    EXPECT_GT(coarse.size(), 0u);
    EXPECT_LT(coarse.size(), refined.size());
}

// The partial boundary is an open polyline ordered by azimuth around the axis
TEST_F(FootprintTest, PartialBoundaryIsOrdered) {
    Vec3 apex = earth.geodeticToCartesian({0.0, 0.0, 2000.0});
    const double tilt = 89.0 * DEGREES_TO_RADIANS;
    Vec3 axis{-std::cos(tilt), std::sin(tilt), 0.0};
    ConeBasis basis = makeConeBasis(axis);

    auto footprint = computeFootprint(apex, axis, 5.0, earth, options);
    ASSERT_GT(footprint.size(), 2u);
    EXPECT_NE(footprint.front(), footprint.back());

    double previous = -1.0;
    for (const auto &p : footprint) {
        Vec3 d = p - apex;
        double azimuth = std::atan2(d.dot(basis.perp2), d.dot(basis.perp1));
        if (azimuth < 0.0) {
            azimuth += TWO_PI;
        }
        EXPECT_GT(azimuth, previous);
        previous = azimuth;
    }
}

TEST_F(FootprintTest, SensorFootprintFollowsOrientation) {
    Vec3 position{WGS84_A + 600000.0, 0.0, 0.0};
    // Rotate +Z onto -X
    Quaternion nadir = Quaternion::fromAxisAngle(UNIT_Y, -std::numbers::pi / 2.0);
    expectVecNear(boresight(nadir), -UNIT_X);

    auto viaOrientation = computeSensorFootprint(position, nadir, 8.0);
    auto viaAxis = computeFootprint(position, -UNIT_X, 8.0);
    ASSERT_EQ(viaOrientation.size(), viaAxis.size());
    for (std::size_t i = 0; i < viaAxis.size(); ++i) {
        expectVecNear(viaOrientation[i], viaAxis[i], 1e-3);
    }
}

TEST_F(FootprintTest, BoresightIntersection) {
    Vec3 position{0.0, 0.0, WGS84_B + 500000.0};
    Quaternion down = Quaternion::fromAxisAngle(UNIT_X, std::numbers::pi);

    auto ground = computeBoresightIntersection(position, down);
    ASSERT_TRUE(ground.has_value());
    EXPECT_NEAR(ground->z, WGS84_B, 1e-6);

    EXPECT_FALSE(computeBoresightIntersection(position, Quaternion::identity()).has_value());
}

TEST_F(FootprintTest, BodyAxes) {
    Vec3 position{1.0, 2.0, 3.0};
    auto axes = computeBodyAxes(position, Quaternion::identity(), 10.0);
    expectVecNear(axes[0].start, position);
    expectVecNear(axes[0].end, position + UNIT_X * 10.0);
    expectVecNear(axes[1].end, position + UNIT_Y * 10.0);
    expectVecNear(axes[2].end, position + UNIT_Z * 10.0);

    Quaternion yaw = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    auto rotated = computeBodyAxes(position, yaw, 10.0);
    expectVecNear(rotated[0].end, position + UNIT_Y * 10.0);
    expectVecNear(rotated[1].end, position - UNIT_X * 10.0);
}

// ============================================================================
// Celestial projection
// ============================================================================

TEST(CelestialProjectionTest, DefaultRadius) {
    EXPECT_DOUBLE_EQ(celestialSphereRadius(), 100.0 * WGS84_A);
}

TEST(CelestialProjectionTest, ExactSampleCount) {
    Vec3 apex{7000000.0, 0.0, 0.0};
    EXPECT_EQ(computeCelestialProjection(apex, UNIT_X, 10.0, 1e8).size(), 36u);
    EXPECT_EQ(computeCelestialProjection(apex, UNIT_X, 10.0, 1e8, 7).size(), 7u);
    EXPECT_TRUE(computeCelestialProjection(apex, UNIT_X, 10.0, 1e8, 0).empty());
}

TEST(CelestialProjectionTest, PointsOnSphereAroundApex) {
    Vec3 apex{7000000.0, -100.0, 42.0};
    Vec3 axis = Vec3{1.0, 1.0, 0.0}.normalize();
    double radius = celestialSphereRadius();

    for (const auto &p : computeCelestialProjection(apex, axis, 15.0, radius)) {
        EXPECT_NEAR(p.distance(apex), radius, 1e-3);
        EXPECT_NEAR(angleBetween(p - apex, axis) * RADIANS_TO_DEGREES, 15.0, 1e-9);
    }
}

// Unlike the ground footprint, the projection never misses
TEST(CelestialProjectionTest, PointingAwayStillProjects) {
    Vec3 apex{WGS84_A + 500000.0, 0.0, 0.0};
    EXPECT_EQ(computeCelestialProjection(apex, UNIT_X, 5.0, celestialSphereRadius()).size(), 36u);
}

}
}
