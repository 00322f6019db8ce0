/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_CONFIG_HPP
#define __SENSORVIEW_CONFIG_HPP

#include <sensorview/covariance.hpp>
#include <sensorview/footprint.hpp>
#include <sensorview/satellite.hpp>
#include <sensorview/trajectory.hpp>

#include <chrono>
#include <optional>

namespace sensorview {

using time_point = std::chrono::system_clock::time_point;

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    // Celestial grid

    double getRASpacing() const;
    void setRASpacing(const double hours);

    double getDecSpacing() const;
    void setDecSpacing(const double degrees);

    int getGridSamples() const;
    void setGridSamples(const int samples);

    double getCelestialRadius() const;
    void setCelestialRadius(const double meters);

    bool getShowGrid() const;
    void setShowGrid(bool);

    // Footprints

    int getFootprintRays() const;
    void setFootprintRays(const int rays);

    double getFootprintOffset() const;
    void setFootprintOffset(const double meters);

    int getSubdivisionRays() const;
    void setSubdivisionRays(const int rays);

    FootprintOptions getFootprintOptions() const;

    // Cones

    double getConeLength() const;
    void setConeLength(const double meters);

    int getConeSegments() const;
    void setConeSegments(const int segments);

    int getSolidConeSegments() const;
    void setSolidConeSegments(const int segments);

    double getAxisLength() const;
    void setAxisLength(const double meters);

    // Uncertainty

    double getSigmaScale() const;
    void setSigmaScale(const double sigma);

    UncertaintyQuality getUncertaintyQuality() const;
    void setUncertaintyQuality(const UncertaintyQuality quality);

    // Input interpretation

    OrientationInterpolation getInterpolation() const;
    void setInterpolation(const OrientationInterpolation mode);

    CoordinatesType getCoordinatesType() const;
    void setCoordinatesType(const CoordinatesType type);

    bool hasTime() const;
    time_point getTime() const;
    void setTime(const time_point tp);

    bool getVerbose() const;
    void setVerbose(bool);

private:
    double raSpacing = 2.0;
    double decSpacing = 15.0;
    int gridSamples = 180;
    double celestialRadius = 0.0;   // 0 = celestialSphereRadius()
    bool showGrid = false;
    int footprintRays = 36;
    double footprintOffset = 100.0;
    int subdivisionRays = 10;
    double coneLength = 50000.0;
    int coneSegments = 16;
    int solidConeSegments = 32;
    double axisLength = 50000.0;
    double sigmaScale = 1.0;
    UncertaintyQuality quality = UncertaintyQuality::Medium;
    OrientationInterpolation interpolation = OrientationInterpolation::Spherical;
    CoordinatesType coordinatesType = CoordinatesType::Geodetic;
    std::optional<time_point> time;
    bool verbose = false;
};

}

#endif
