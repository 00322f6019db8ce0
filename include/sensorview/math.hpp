/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_MATH_HPP
#define __SENSORVIEW_MATH_HPP

#include <cmath>
#include <numbers>

namespace sensorview {

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

// ============================================================================
// Vectors
// ============================================================================

/**
 * 3D vector in Cartesian coordinates (meters for positions).
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator-() const {
        return {-x, -y, -z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    bool operator==(const Vec3& other) const = default;

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    double distance(const Vec3& other) const {
        return (*this - other).magnitude();
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     * A zero vector is returned unchanged.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        if (mag == 0.0) {
            return *this;
        }
        return {x / mag, y / mag, z / mag};
    }
};

constexpr Vec3 UNIT_X{1.0, 0.0, 0.0};
constexpr Vec3 UNIT_Y{0.0, 1.0, 0.0};
constexpr Vec3 UNIT_Z{0.0, 0.0, 1.0};

/**
 * Componentwise linear interpolation: a + (b - a) * f.
 */
Vec3 lerp(const Vec3& a, const Vec3& b, double f);

struct Mat3;

// ============================================================================
// Quaternions
// ============================================================================

/**
 * Rotation quaternion stored as (x, y, z, w), w being the scalar part.
 *
 * Quaternions coming from telemetry are not trusted to be normalized;
 * every operation that depends on unit length normalizes first.
 */
struct Quaternion {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double w = 1.0;

    static Quaternion identity() { return {0.0, 0.0, 0.0, 1.0}; }

    /**
     * Rotation of `angleInRadians` about `axis` (right-handed).
     */
    static Quaternion fromAxisAngle(const Vec3& axis, double angleInRadians);

    /**
     * Converts a proper rotation matrix to a unit quaternion.
     */
    static Quaternion fromRotationMatrix(const Mat3& m);

    /**
     * Hamilton product. (a * b) applies b first, then a.
     */
    Quaternion operator*(const Quaternion& q) const;

    double norm() const {
        return std::sqrt(x*x + y*y + z*z + w*w);
    }

    double dot(const Quaternion& q) const {
        return x * q.x + y * q.y + z * q.z + w * q.w;
    }

    /** Normalized copy. A zero quaternion normalizes to identity. */
    Quaternion normalize() const;

    Quaternion conjugate() const {
        return {-x, -y, -z, w};
    }

    /** Rotates v by the normalized quaternion. */
    Vec3 rotate(const Vec3& v) const;

    /** Rotation matrix of the normalized quaternion. */
    Mat3 toRotationMatrix() const;
};

/**
 * Componentwise linear interpolation followed by renormalization.
 * Takes the short path (flips b when a.b < 0).
 */
Quaternion lerp(const Quaternion& a, const Quaternion& b, double f);

/**
 * Spherical linear interpolation between two rotations.
 */
Quaternion slerp(const Quaternion& a, const Quaternion& b, double f);

// ============================================================================
// Matrices
// ============================================================================

/**
 * Row-major 3x3 matrix, used for rotations and covariance tensors.
 */
struct Mat3 {
    double m[3][3] = {{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};

    static Mat3 identity();

    /** Matrix whose columns are c0, c1, c2. */
    static Mat3 fromColumns(const Vec3& c0, const Vec3& c1, const Vec3& c2);

    /** Rotation of `angleInRadians` about +Z (right-handed, active). */
    static Mat3 rotationZ(double angleInRadians);

    /** Outer product a * b^T. */
    static Mat3 outer(const Vec3& a, const Vec3& b);

    Vec3 operator*(const Vec3& v) const;
    Mat3 operator*(const Mat3& other) const;
    Mat3 operator*(double scalar) const;
    Mat3 operator+(const Mat3& other) const;
    Mat3 operator-(const Mat3& other) const;

    Mat3 transpose() const;
    Vec3 column(int c) const;
};

}

#endif
