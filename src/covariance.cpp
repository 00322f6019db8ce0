/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/covariance.hpp>

#include <algorithm>
#include <cmath>

namespace sensorview {

Mat3 CovarianceMatrix::toMatrix() const {
    Mat3 result;
    result.m[0][0] = xx; result.m[0][1] = xy; result.m[0][2] = xz;
    result.m[1][0] = xy; result.m[1][1] = yy; result.m[1][2] = yz;
    result.m[2][0] = xz; result.m[2][1] = yz; result.m[2][2] = zz;
    return result;
}

EigenPair powerIteration(const Mat3 &matrix, std::mt19937 &rng, int iterations) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    Vec3 v{dist(rng), dist(rng), dist(rng)};
    if (v.magnitude() == 0.0) {
        v = {1.0, 1.0, 1.0};
    }
    v = v.normalize();

    double eigenvalue = 0.0;
    for (int i = 0; i < iterations; ++i) {
        Vec3 next = matrix * v;
        eigenvalue = next.dot(v);
        if (next.magnitude() < 1e-300) {
            // v is in the null space
            break;
        }
        v = next.normalize();
    }

    return {eigenvalue, v};
}

namespace {

Vec3 anyPerpendicular(const Vec3 &v) {
    Vec3 p = v.cross(UNIT_Z);
    if (p.magnitude() < 0.01) {
        p = v.cross(UNIT_X);
    }
    return p.normalize();
}

double clampRadius(double eigenvalue, double sigmaScale) {
    double r = std::sqrt(std::abs(eigenvalue)) * sigmaScale;
    return std::clamp(r, MIN_ELLIPSOID_RADIUS, MAX_ELLIPSOID_RADIUS);
}

}

EllipsoidParameters covarianceToEllipsoid(const CovarianceMatrix &covariance,
                                          double sigmaScale, std::mt19937 &rng) {
    const Mat3 matrix = covariance.toMatrix();

    // Largest principal axis
    EigenPair first = powerIteration(matrix, rng);
    Vec3 v1 = first.vector.normalize();

    // Deflate: M' = M - λ₁ v₁ v₁ᵀ
    Mat3 deflated = matrix - Mat3::outer(v1, v1) * first.value;
    EigenPair second = powerIteration(deflated, rng);

    // Gram-Schmidt against v1
    Vec3 v2 = second.vector - v1 * v1.dot(second.vector);
    if (v2.magnitude() < 1e-9) {
        v2 = anyPerpendicular(v1);
    } else {
        v2 = v2.normalize();
    }
    double lambda2 = v2.dot(deflated * v2);

    Vec3 v3 = v1.cross(v2).normalize();
    double lambda3 = std::abs(v3.dot(matrix * v3));

    EllipsoidParameters result;
    result.radii = {
        clampRadius(first.value, sigmaScale),
        clampRadius(lambda2, sigmaScale),
        clampRadius(lambda3, sigmaScale)
    };
    result.orientation = Quaternion::fromRotationMatrix(Mat3::fromColumns(v1, v2, v3));
    return result;
}

EllipsoidParameters covarianceToEllipsoid(const CovarianceMatrix &covariance,
                                          double sigmaScale, std::uint32_t seed) {
    std::mt19937 rng(seed);
    return covarianceToEllipsoid(covariance, sigmaScale, rng);
}

UncertaintyQuality parseUncertaintyQuality(std::string_view text) {
    if (text == "High" || text == "High (70%)") {
        return UncertaintyQuality::High;
    }
    if (text == "Low" || text == "Low (10%)") {
        return UncertaintyQuality::Low;
    }
    return UncertaintyQuality::Medium;
}

std::string toString(UncertaintyQuality quality) {
    switch (quality) {
        case UncertaintyQuality::High:
            return "High";
        case UncertaintyQuality::Low:
            return "Low";
        case UncertaintyQuality::Medium:
        default:
            return "Medium";
    }
}

double opacityForQuality(UncertaintyQuality quality) {
    switch (quality) {
        case UncertaintyQuality::High:
            return 0.7;
        case UncertaintyQuality::Low:
            return 0.1;
        case UncertaintyQuality::Medium:
        default:
            return 0.3;
    }
}

double opacityForQuality(std::string_view mode) {
    return opacityForQuality(parseUncertaintyQuality(mode));
}

}
