/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_FRAMES_HPP
#define __SENSORVIEW_FRAMES_HPP

#include <sensorview/math.hpp>

#include <chrono>
#include <string>

namespace sensorview {

using time_point = std::chrono::system_clock::time_point;

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01T00:00:00Z
constexpr double MJD_OFFSET = 2400000.5;                    // JD - MJD
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// ============================================================================
// Time Functions
// ============================================================================

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Converts a Julian Date to a time_point (microsecond resolution).
 */
time_point fromJulianDate(double julianDate);

double julianDateToMJD(double julianDate);
double mjdToJulianDate(double mjd);

/**
 * Converts Unix milliseconds (the telemetry time column) to Julian Date.
 */
double unixMillisToJulianDate(double millis);

/**
 * Parses a UTC timestamp in "YYYY-MM-DD HH:MM:SS" format.
 * @throws std::invalid_argument if the text does not match
 */
time_point parseTimestamp(const std::string &text);

/**
 * Formats a Julian Date as "YYYY-MM-DD HH:MM:SS UTC".
 */
std::string formatJulianDate(double julianDate);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

// ============================================================================
// Frame Transformations
// ============================================================================

/**
 * Rotation taking Earth-fixed (ECEF) vectors to the inertial (ECI) frame.
 *
 * The Earth rotation model is a rotation about +Z by GMST; precession,
 * nutation and polar motion are not modeled.
 */
Mat3 earthFixedToInertial(double julianDate);

/**
 * Rotation taking inertial (ECI) vectors to the Earth-fixed (ECEF) frame.
 * This is the transpose of earthFixedToInertial().
 */
Mat3 inertialToEarthFixed(double julianDate);

/**
 * Composes two orientations: the inner rotation is applied first, then the
 * outer one. Used to chain sensor-body -> satellite-body -> world.
 */
Quaternion composeOrientation(const Quaternion &outer, const Quaternion &inner);

/**
 * Rotates a direction by a rotation matrix.
 */
Vec3 applyRotation(const Mat3 &matrix, const Vec3 &vector);

}

#endif
