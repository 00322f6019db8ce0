/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sensorview/math.hpp>

#include <cmath>
#include <numbers>

namespace sensorview {
namespace {

constexpr double EPSILON = 1e-12;

void expectVecNear(const Vec3 &actual, const Vec3 &expected, double tolerance = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

// Quaternions q and -q are the same rotation
void expectSameRotation(const Quaternion &a, const Quaternion &b, double tolerance = 1e-9) {
    EXPECT_NEAR(std::abs(a.normalize().dot(b.normalize())), 1.0, tolerance);
}

// ============================================================================
// Vec3
// ============================================================================

TEST(Vec3Test, Arithmetic) {
    Vec3 a{1.0, 2.0, 3.0};
    Vec3 b{4.0, 5.0, 6.0};

    EXPECT_EQ(a + b, (Vec3{5.0, 7.0, 9.0}));
    EXPECT_EQ(b - a, (Vec3{3.0, 3.0, 3.0}));
    EXPECT_EQ(-a, (Vec3{-1.0, -2.0, -3.0}));
    EXPECT_EQ(a * 2.0, (Vec3{2.0, 4.0, 6.0}));
    EXPECT_DOUBLE_EQ(a.dot(b), 32.0);
}

TEST(Vec3Test, CrossProductIsRightHanded) {
    EXPECT_EQ(UNIT_X.cross(UNIT_Y), UNIT_Z);
    EXPECT_EQ(UNIT_Y.cross(UNIT_Z), UNIT_X);
    EXPECT_EQ(UNIT_Z.cross(UNIT_X), UNIT_Y);
}

TEST(Vec3Test, MagnitudeAndDistance) {
    Vec3 v{3.0, 4.0, 12.0};
    EXPECT_DOUBLE_EQ(v.magnitude(), 13.0);
    EXPECT_DOUBLE_EQ(Vec3{}.distance(v), 13.0);
}

TEST(Vec3Test, NormalizeProducesUnitVector) {
    Vec3 n = Vec3{10.0, -20.0, 5.0}.normalize();
    EXPECT_NEAR(n.magnitude(), 1.0, EPSILON);
}

TEST(Vec3Test, NormalizeZeroVectorIsUnchanged) {
    Vec3 zero{0.0, 0.0, 0.0};
    Vec3 n = zero.normalize();
    EXPECT_EQ(n, zero);
    EXPECT_FALSE(std::isnan(n.x));
}

TEST(Vec3Test, Lerp) {
    Vec3 a{0.0, 0.0, 0.0};
    Vec3 b{10.0, 20.0, -30.0};
    expectVecNear(lerp(a, b, 0.0), a);
    expectVecNear(lerp(a, b, 1.0), b);
    expectVecNear(lerp(a, b, 0.25), Vec3{2.5, 5.0, -7.5});
}

// ============================================================================
// Quaternion
// ============================================================================

TEST(QuaternionTest, DefaultIsIdentity) {
    Quaternion q;
    EXPECT_DOUBLE_EQ(q.w, 1.0);
    expectVecNear(q.rotate(Vec3{1.0, 2.0, 3.0}), Vec3{1.0, 2.0, 3.0});
}

TEST(QuaternionTest, AxisAngleRotation) {
    Quaternion q = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    expectVecNear(q.rotate(UNIT_X), UNIT_Y);
    expectVecNear(q.rotate(UNIT_Y), -UNIT_X);
    expectVecNear(q.rotate(UNIT_Z), UNIT_Z);
}

TEST(QuaternionTest, RotateNormalizesFirst) {
    Quaternion q = Quaternion::fromAxisAngle(UNIT_X, std::numbers::pi / 2.0);
    Quaternion scaled{q.x * 5.0, q.y * 5.0, q.z * 5.0, q.w * 5.0};
    expectVecNear(scaled.rotate(UNIT_Y), UNIT_Z);
}

TEST(QuaternionTest, ZeroNormalizesToIdentity) {
    Quaternion zero{0.0, 0.0, 0.0, 0.0};
    Quaternion n = zero.normalize();
    EXPECT_DOUBLE_EQ(n.w, 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.0);
}

// (a * b) applies b first
TEST(QuaternionTest, ProductOrder) {
    Quaternion a = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    Quaternion b = Quaternion::fromAxisAngle(UNIT_X, std::numbers::pi / 2.0);
    Vec3 v{0.3, -1.2, 2.0};

    expectVecNear((a * b).rotate(v), a.rotate(b.rotate(v)));
    // Y -> (b) Z -> (a) Z
    expectVecNear((a * b).rotate(UNIT_Y), UNIT_Z);
    // Y -> (a) -X -> (b) -X
    expectVecNear((b * a).rotate(UNIT_Y), -UNIT_X);
}

TEST(QuaternionTest, ConjugateInvertsRotation) {
    Quaternion q = Quaternion::fromAxisAngle(Vec3{1.0, 1.0, 0.0}, 0.7);
    Vec3 v{1.0, 2.0, 3.0};
    expectVecNear(q.conjugate().rotate(q.rotate(v)), v);
}

TEST(QuaternionTest, RotationMatrixMatchesRotate) {
    Quaternion q = Quaternion::fromAxisAngle(Vec3{0.2, -0.5, 0.8}, 1.3);
    Mat3 m = q.toRotationMatrix();
    Vec3 v{4.0, -1.0, 0.5};
    expectVecNear(m * v, q.rotate(v));
}

TEST(QuaternionTest, FromRotationMatrixRecoversRotation) {
    Quaternion small = Quaternion::fromAxisAngle(Vec3{0.0, 1.0, 1.0}, 0.4);
    expectSameRotation(Quaternion::fromRotationMatrix(small.toRotationMatrix()), small);

    // Near 180 degrees the trace is negative
    Quaternion large = Quaternion::fromAxisAngle(Vec3{1.0, 0.2, 0.1}, 3.1);
    expectSameRotation(Quaternion::fromRotationMatrix(large.toRotationMatrix()), large);

    Quaternion aboutZ = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi);
    expectSameRotation(Quaternion::fromRotationMatrix(aboutZ.toRotationMatrix()), aboutZ);
}

TEST(QuaternionTest, SlerpEndpoints) {
    Quaternion a = Quaternion::identity();
    Quaternion b = Quaternion::fromAxisAngle(UNIT_Y, 1.0);
    expectSameRotation(slerp(a, b, 0.0), a);
    expectSameRotation(slerp(a, b, 1.0), b);
}

// Midpoint of 0 and 90 degrees about Z is 45 degrees about Z
TEST(QuaternionTest, SlerpMidpoint) {
    Quaternion a = Quaternion::identity();
    Quaternion b = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    Quaternion mid = slerp(a, b, 0.5);

    expectSameRotation(mid, Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 4.0));
    double s = std::sqrt(0.5);
    expectVecNear(mid.rotate(UNIT_X), Vec3{s, s, 0.0});
}

TEST(QuaternionTest, SlerpTakesShortestPath) {
    Quaternion a = Quaternion::identity();
    Quaternion b = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    Quaternion negB{-b.x, -b.y, -b.z, -b.w};
    expectSameRotation(slerp(a, negB, 0.5), slerp(a, b, 0.5));
}

TEST(QuaternionTest, SlerpOfNearlyEqualRotations) {
    Quaternion a = Quaternion::fromAxisAngle(UNIT_X, 0.5);
    Quaternion b = Quaternion::fromAxisAngle(UNIT_X, 0.5 + 1e-9);
    Quaternion mid = slerp(a, b, 0.5);
    EXPECT_FALSE(std::isnan(mid.w));
    expectSameRotation(mid, a);
}

TEST(QuaternionTest, LerpIsNormalized) {
    Quaternion a = Quaternion::identity();
    Quaternion b = Quaternion::fromAxisAngle(UNIT_X, 2.0);
    EXPECT_NEAR(lerp(a, b, 0.3).norm(), 1.0, EPSILON);
}

// ============================================================================
// Mat3
// ============================================================================

TEST(Mat3Test, RotationZIsActive) {
    Mat3 r = Mat3::rotationZ(std::numbers::pi / 2.0);
    expectVecNear(r * UNIT_X, UNIT_Y);
}

TEST(Mat3Test, TransposeOfRotationIsInverse) {
    Mat3 r = Mat3::rotationZ(0.77);
    Mat3 product = r * r.transpose();
    Mat3 identity = Mat3::identity();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            EXPECT_NEAR(product.m[i][j], identity.m[i][j], EPSILON);
        }
    }
}

TEST(Mat3Test, OuterProduct) {
    Mat3 o = Mat3::outer(Vec3{1.0, 2.0, 3.0}, Vec3{4.0, 5.0, 6.0});
    EXPECT_DOUBLE_EQ(o.m[0][0], 4.0);
    EXPECT_DOUBLE_EQ(o.m[0][2], 6.0);
    EXPECT_DOUBLE_EQ(o.m[2][1], 15.0);
}

TEST(Mat3Test, ColumnsRoundTrip) {
    Vec3 c0{1.0, 2.0, 3.0};
    Vec3 c1{4.0, 5.0, 6.0};
    Vec3 c2{7.0, 8.0, 9.0};
    Mat3 m = Mat3::fromColumns(c0, c1, c2);
    EXPECT_EQ(m.column(0), c0);
    EXPECT_EQ(m.column(1), c1);
    EXPECT_EQ(m.column(2), c2);
    EXPECT_EQ(m * UNIT_Y, c1);
}

}
}
