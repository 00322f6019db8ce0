/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/frames.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <date/date.h>

namespace sensorview {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

time_point fromJulianDate(double julianDate) {
    using namespace std::chrono;

    auto sinceEpoch = duration<double, days::period>(julianDate - UNIX_EPOCH_JD);
    return time_point(duration_cast<system_clock::duration>(
        round<microseconds>(sinceEpoch)
    ));
}

double julianDateToMJD(double julianDate) {
    return julianDate - MJD_OFFSET;
}

double mjdToJulianDate(double mjd) {
    return mjd + MJD_OFFSET;
}

double unixMillisToJulianDate(double millis) {
    return UNIX_EPOCH_JD + millis / 86400000.0;
}

time_point parseTimestamp(const std::string &text) {
    std::istringstream in(text);
    time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + text);
    }
    return tp;
}

std::string formatJulianDate(double julianDate) {
    auto truncated = std::chrono::floor<std::chrono::seconds>(fromJulianDate(julianDate));
    return date::format("%F %T UTC", truncated);
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

// The Earth-fixed X axis leads the inertial X axis by GMST about +Z, so
// fixed -> inertial is an active rotation by +GMST.
Mat3 earthFixedToInertial(double julianDate) {
    return Mat3::rotationZ(gmst(julianDate));
}

Mat3 inertialToEarthFixed(double julianDate) {
    return earthFixedToInertial(julianDate).transpose();
}

Quaternion composeOrientation(const Quaternion &outer, const Quaternion &inner) {
    return outer * inner;
}

Vec3 applyRotation(const Mat3 &matrix, const Vec3 &vector) {
    return matrix * vector;
}

}
