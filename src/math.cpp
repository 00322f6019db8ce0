/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/math.hpp>

#include <cmath>

namespace sensorview {

Vec3 lerp(const Vec3& a, const Vec3& b, double f) {
    return a + (b - a) * f;
}

// ============================================================================
// Quaternion
// ============================================================================

Quaternion Quaternion::fromAxisAngle(const Vec3& axis, double angleInRadians) {
    double half = angleInRadians * 0.5;
    double s = std::sin(half);
    Vec3 n = axis.normalize();
    return {n.x * s, n.y * s, n.z * s, std::cos(half)};
}

// Shepperd's method: pick the largest of (trace, diagonal) to keep the
// square root well away from zero.
Quaternion Quaternion::fromRotationMatrix(const Mat3& r) {
    const auto& m = r.m;
    double trace = m[0][0] + m[1][1] + m[2][2];
    Quaternion q;

    if (trace > 0.0) {
        double s = std::sqrt(trace + 1.0) * 2.0;
        q.w = 0.25 * s;
        q.x = (m[2][1] - m[1][2]) / s;
        q.y = (m[0][2] - m[2][0]) / s;
        q.z = (m[1][0] - m[0][1]) / s;
    } else if (m[0][0] > m[1][1] && m[0][0] > m[2][2]) {
        double s = std::sqrt(1.0 + m[0][0] - m[1][1] - m[2][2]) * 2.0;
        q.w = (m[2][1] - m[1][2]) / s;
        q.x = 0.25 * s;
        q.y = (m[0][1] + m[1][0]) / s;
        q.z = (m[0][2] + m[2][0]) / s;
    } else if (m[1][1] > m[2][2]) {
        double s = std::sqrt(1.0 + m[1][1] - m[0][0] - m[2][2]) * 2.0;
        q.w = (m[0][2] - m[2][0]) / s;
        q.x = (m[0][1] + m[1][0]) / s;
        q.y = 0.25 * s;
        q.z = (m[1][2] + m[2][1]) / s;
    } else {
        double s = std::sqrt(1.0 + m[2][2] - m[0][0] - m[1][1]) * 2.0;
        q.w = (m[1][0] - m[0][1]) / s;
        q.x = (m[0][2] + m[2][0]) / s;
        q.y = (m[1][2] + m[2][1]) / s;
        q.z = 0.25 * s;
    }

    return q.normalize();
}

Quaternion Quaternion::operator*(const Quaternion& q) const {
    return {
        w*q.x + x*q.w + y*q.z - z*q.y,
        w*q.y - x*q.z + y*q.w + z*q.x,
        w*q.z + x*q.y - y*q.x + z*q.w,
        w*q.w - x*q.x - y*q.y - z*q.z
    };
}

Quaternion Quaternion::normalize() const {
    double n = norm();
    if (n == 0.0) {
        return identity();
    }
    return {x / n, y / n, z / n, w / n};
}

Vec3 Quaternion::rotate(const Vec3& v) const {
    Quaternion q = normalize();
    Vec3 u{q.x, q.y, q.z};
    return u * (2.0 * u.dot(v))
         + v * (q.w * q.w - u.dot(u))
         + u.cross(v) * (2.0 * q.w);
}

Mat3 Quaternion::toRotationMatrix() const {
    Quaternion q = normalize();
    double xx = q.x * q.x, yy = q.y * q.y, zz = q.z * q.z;
    double xy = q.x * q.y, xz = q.x * q.z, yz = q.y * q.z;
    double wx = q.w * q.x, wy = q.w * q.y, wz = q.w * q.z;

    Mat3 r;
    r.m[0][0] = 1.0 - 2.0 * (yy + zz);
    r.m[0][1] = 2.0 * (xy - wz);
    r.m[0][2] = 2.0 * (xz + wy);

    r.m[1][0] = 2.0 * (xy + wz);
    r.m[1][1] = 1.0 - 2.0 * (xx + zz);
    r.m[1][2] = 2.0 * (yz - wx);

    r.m[2][0] = 2.0 * (xz - wy);
    r.m[2][1] = 2.0 * (yz + wx);
    r.m[2][2] = 1.0 - 2.0 * (xx + yy);
    return r;
}

Quaternion lerp(const Quaternion& a, const Quaternion& b, double f) {
    Quaternion end = b;
    if (a.dot(b) < 0.0) {
        end = {-b.x, -b.y, -b.z, -b.w};
    }
    return Quaternion{
        a.x + (end.x - a.x) * f,
        a.y + (end.y - a.y) * f,
        a.z + (end.z - a.z) * f,
        a.w + (end.w - a.w) * f
    }.normalize();
}

Quaternion slerp(const Quaternion& a, const Quaternion& b, double f) {
    Quaternion start = a.normalize();
    Quaternion end = b.normalize();

    double cosHalfTheta = start.dot(end);
    if (cosHalfTheta < 0.0) {
        end = {-end.x, -end.y, -end.z, -end.w};
        cosHalfTheta = -cosHalfTheta;
    }

    if (cosHalfTheta >= 1.0) {
        return start;
    }

    double halfTheta = std::acos(cosHalfTheta);
    double sinHalfTheta = std::sqrt(1.0 - cosHalfTheta * cosHalfTheta);

    // Nearly identical rotations: fall back to normalized lerp
    if (sinHalfTheta < 1e-6) {
        return lerp(start, end, f);
    }

    double ratioA = std::sin((1.0 - f) * halfTheta) / sinHalfTheta;
    double ratioB = std::sin(f * halfTheta) / sinHalfTheta;

    return Quaternion{
        start.x * ratioA + end.x * ratioB,
        start.y * ratioA + end.y * ratioB,
        start.z * ratioA + end.z * ratioB,
        start.w * ratioA + end.w * ratioB
    }.normalize();
}

// ============================================================================
// Mat3
// ============================================================================

Mat3 Mat3::identity() {
    Mat3 r;
    r.m[0][0] = r.m[1][1] = r.m[2][2] = 1.0;
    return r;
}

Mat3 Mat3::fromColumns(const Vec3& c0, const Vec3& c1, const Vec3& c2) {
    Mat3 r;
    r.m[0][0] = c0.x; r.m[0][1] = c1.x; r.m[0][2] = c2.x;
    r.m[1][0] = c0.y; r.m[1][1] = c1.y; r.m[1][2] = c2.y;
    r.m[2][0] = c0.z; r.m[2][1] = c1.z; r.m[2][2] = c2.z;
    return r;
}

Mat3 Mat3::rotationZ(double angleInRadians) {
    double c = std::cos(angleInRadians);
    double s = std::sin(angleInRadians);
    Mat3 r;
    r.m[0][0] = c;  r.m[0][1] = -s;
    r.m[1][0] = s;  r.m[1][1] = c;
    r.m[2][2] = 1.0;
    return r;
}

Mat3 Mat3::outer(const Vec3& a, const Vec3& b) {
    return fromColumns(a * b.x, a * b.y, a * b.z);
}

Vec3 Mat3::operator*(const Vec3& v) const {
    return {
        m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
        m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
        m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z
    };
}

Mat3 Mat3::operator*(const Mat3& other) const {
    Mat3 r;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            r.m[i][j] = m[i][0] * other.m[0][j]
                      + m[i][1] * other.m[1][j]
                      + m[i][2] * other.m[2][j];
        }
    }
    return r;
}

Mat3 Mat3::operator*(double scalar) const {
    Mat3 r;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            r.m[i][j] = m[i][j] * scalar;
        }
    }
    return r;
}

Mat3 Mat3::operator+(const Mat3& other) const {
    Mat3 r;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            r.m[i][j] = m[i][j] + other.m[i][j];
        }
    }
    return r;
}

Mat3 Mat3::operator-(const Mat3& other) const {
    return *this + other * -1.0;
}

Mat3 Mat3::transpose() const {
    Mat3 r;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            r.m[i][j] = m[j][i];
        }
    }
    return r;
}

Vec3 Mat3::column(int c) const {
    return {m[0][c], m[1][c], m[2][c]};
}

}
