/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sensorview/frames.hpp>

#include <chrono>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace sensorview {
namespace {

void expectVecNear(const Vec3 &actual, const Vec3 &expected, double tolerance = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

// ============================================================================
// Time
// ============================================================================

TEST(TimeTest, UnixEpochJulianDate) {
    time_point epoch{};
    EXPECT_DOUBLE_EQ(toJulianDate(epoch), UNIX_EPOCH_JD);
}

TEST(TimeTest, J2000JulianDate) {
    // J2000.0 is 2000-01-01 12:00:00 TT; we treat it as UTC
    auto tp = parseTimestamp("2000-01-01 12:00:00");
    EXPECT_NEAR(toJulianDate(tp), J2000_JD, 1e-9);
}

TEST(TimeTest, FromJulianDateRoundTrip) {
    auto tp = parseTimestamp("2024-03-15 06:30:45");
    auto back = fromJulianDate(toJulianDate(tp));
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(back - tp).count();
    EXPECT_LE(std::abs(diff), 1);
}

TEST(TimeTest, ModifiedJulianDate) {
    EXPECT_DOUBLE_EQ(julianDateToMJD(2400000.5), 0.0);
    EXPECT_DOUBLE_EQ(julianDateToMJD(J2000_JD), 51544.5);
    EXPECT_DOUBLE_EQ(mjdToJulianDate(51544.5), J2000_JD);
}

TEST(TimeTest, UnixMillis) {
    EXPECT_DOUBLE_EQ(unixMillisToJulianDate(0.0), UNIX_EPOCH_JD);
    EXPECT_DOUBLE_EQ(unixMillisToJulianDate(86400000.0), UNIX_EPOCH_JD + 1.0);
    // 2000-01-01 12:00:00 UTC
    EXPECT_NEAR(unixMillisToJulianDate(946728000000.0), J2000_JD, 1e-9);
}

TEST(TimeTest, ParseTimestampRejectsGarbage) {
    EXPECT_THROW(parseTimestamp("not a time"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2024-13-45"), std::invalid_argument);
}

TEST(TimeTest, FormatJulianDate) {
    EXPECT_EQ(formatJulianDate(J2000_JD), "2000-01-01 12:00:00 UTC");
    EXPECT_EQ(formatJulianDate(UNIX_EPOCH_JD), "1970-01-01 00:00:00 UTC");
}

TEST(TimeTest, GMSTAtJ2000) {
    EXPECT_NEAR(gmst(J2000_JD), GMST_AT_J2000 * DEGREES_TO_RADIANS, 1e-9);
}

TEST(TimeTest, GMSTIsNormalized) {
    for (double jd : {J2000_JD - 10000.3, J2000_JD + 0.25, J2000_JD + 9000.7}) {
        double g = gmst(jd);
        EXPECT_GE(g, 0.0);
        EXPECT_LT(g, TWO_PI);
    }
}

// ============================================================================
// Frames
// ============================================================================

TEST(FrameTest, FixedAndInertialAreInverse) {
    double jd = J2000_JD + 1234.567;
    Mat3 toInertial = earthFixedToInertial(jd);
    Mat3 toFixed = inertialToEarthFixed(jd);

    Vec3 v{7000000.0, -1200000.0, 300000.0};
    expectVecNear(applyRotation(toFixed, applyRotation(toInertial, v)), v, 1e-6);
    expectVecNear(applyRotation(toInertial, applyRotation(toFixed, v)), v, 1e-6);
}

TEST(FrameTest, RotationIsAboutPolarAxis) {
    double jd = J2000_JD + 42.0;
    Vec3 pole{0.0, 0.0, 6356752.0};
    expectVecNear(applyRotation(earthFixedToInertial(jd), pole), pole, 1e-6);
}

// The Earth-fixed X axis sits at right ascension GMST
TEST(FrameTest, FixedXAxisPointsAtGMST) {
    double jd = J2000_JD + 100.1;
    double theta = gmst(jd);
    Vec3 xInertial = applyRotation(earthFixedToInertial(jd), UNIT_X);
    expectVecNear(xInertial, Vec3{std::cos(theta), std::sin(theta), 0.0});
}

TEST(FrameTest, RotationPreservesLength) {
    double jd = J2000_JD - 3.3;
    Vec3 v{1.0, 2.0, 3.0};
    EXPECT_NEAR(applyRotation(inertialToEarthFixed(jd), v).magnitude(), v.magnitude(), 1e-12);
}

// Sensor offset is applied first, then the satellite attitude
TEST(FrameTest, ComposeOrientationOrder) {
    Quaternion satellite = Quaternion::fromAxisAngle(UNIT_Z, std::numbers::pi / 2.0);
    Quaternion sensor = Quaternion::fromAxisAngle(UNIT_Y, std::numbers::pi / 2.0);
    Quaternion world = composeOrientation(satellite, sensor);

    // Sensor boresight +Z -> (sensor) +X -> (satellite) +Y
    expectVecNear(world.rotate(UNIT_Z), UNIT_Y);
}

}
}
