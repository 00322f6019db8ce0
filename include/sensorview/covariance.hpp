/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_COVARIANCE_HPP
#define __SENSORVIEW_COVARIANCE_HPP

#include <sensorview/math.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace sensorview {

// Radius bounds for displayed uncertainty ellipsoids (m)
constexpr double MIN_ELLIPSOID_RADIUS = 10.0;
constexpr double MAX_ELLIPSOID_RADIUS = 100000.0;

// Seed used when the caller does not supply a generator
constexpr std::uint32_t DEFAULT_POWER_ITERATION_SEED = 42;

constexpr int POWER_ITERATIONS = 100;

/**
 * Symmetric 3x3 position covariance (m²). Not assumed positive-definite.
 */
struct CovarianceMatrix {
    double xx, yy, zz;
    double xy = 0.0;
    double xz = 0.0;
    double yz = 0.0;

    Mat3 toMatrix() const;
};

struct EllipsoidParameters {
    Vec3 radii;                 ///< Semi-axis lengths (m, sigma-scaled, clamped)
    Quaternion orientation;     ///< Rotation whose columns are the principal axes
};

struct EigenPair {
    double value;
    Vec3 vector;
};

/**
 * Dominant eigenvalue and eigenvector by power iteration.
 *
 * The start vector is drawn uniformly from [0, 1)^3 using `rng`. If the
 * iterate collapses to zero the last non-zero vector is kept.
 */
EigenPair powerIteration(const Mat3 &matrix, std::mt19937 &rng,
                         int iterations = POWER_ITERATIONS);

/**
 * Converts a covariance matrix into ellipsoid radii and orientation.
 *
 * The first two principal axes come from power iteration with deflation
 * (M' = M - λ₁ v₁ v₁ᵀ); the third is their cross product. Each radius is
 * sqrt(|λ|) * sigmaScale clamped to [MIN_ELLIPSOID_RADIUS, MAX_ELLIPSOID_RADIUS].
 * Never throws.
 *
 * @param sigmaScale Confidence scale (1 = 1σ, 2 = 2σ, 3 = 3σ)
 */
EllipsoidParameters covarianceToEllipsoid(const CovarianceMatrix &covariance,
                                          double sigmaScale, std::mt19937 &rng);

EllipsoidParameters covarianceToEllipsoid(const CovarianceMatrix &covariance,
                                          double sigmaScale = 1.0,
                                          std::uint32_t seed = DEFAULT_POWER_ITERATION_SEED);

enum class UncertaintyQuality {
    High,
    Medium,
    Low
};

/**
 * Parses "High", "Medium", "Low" or the long forms "High (70%)",
 * "Medium (30%)", "Low (10%)". Anything else is Medium.
 */
UncertaintyQuality parseUncertaintyQuality(std::string_view text);

std::string toString(UncertaintyQuality quality);

double opacityForQuality(UncertaintyQuality quality);

/**
 * Opacity for a quality mode name: High 0.7, Medium 0.3, Low 0.1, and 0.3
 * for anything unrecognized.
 */
double opacityForQuality(std::string_view mode);

}

#endif
