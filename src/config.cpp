/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/config.hpp>

#include <algorithm>

namespace sensorview {

double Config::getRASpacing() const {
    return raSpacing;
}

void Config::setRASpacing(const double hours) {
    if (hours >= 1.0 && hours <= 6.0) {
        raSpacing = hours;
    } else if (hours > 6.0) {
        raSpacing = 6.0;
    } else {
        raSpacing = 1.0;
    }
}

double Config::getDecSpacing() const {
    return decSpacing;
}

void Config::setDecSpacing(const double degrees) {
    if (degrees >= 10.0 && degrees <= 30.0) {
        decSpacing = degrees;
    } else if (degrees > 30.0) {
        decSpacing = 30.0;
    } else {
        decSpacing = 10.0;
    }
}

int Config::getGridSamples() const {
    return gridSamples;
}

void Config::setGridSamples(const int samples) {
    gridSamples = std::clamp(samples, 4, 3600);
}

double Config::getCelestialRadius() const {
    if (celestialRadius > 0.0) {
        return celestialRadius;
    }
    return celestialSphereRadius();
}

void Config::setCelestialRadius(const double meters) {
    celestialRadius = std::max(meters, 0.0);
}

bool Config::getShowGrid() const {
    return showGrid;
}

void Config::setShowGrid(bool show) {
    showGrid = show;
}

int Config::getFootprintRays() const {
    return footprintRays;
}

void Config::setFootprintRays(const int rays) {
    footprintRays = std::clamp(rays, 3, 360);
}

double Config::getFootprintOffset() const {
    return footprintOffset;
}

void Config::setFootprintOffset(const double meters) {
    footprintOffset = std::max(meters, 0.0);
}

int Config::getSubdivisionRays() const {
    return subdivisionRays;
}

void Config::setSubdivisionRays(const int rays) {
    subdivisionRays = std::clamp(rays, 0, 100);
}

FootprintOptions Config::getFootprintOptions() const {
    return {
        .baseRayCount = footprintRays,
        .offsetMeters = footprintOffset,
        .subdivisionRays = subdivisionRays
    };
}

double Config::getConeLength() const {
    return coneLength;
}

void Config::setConeLength(const double meters) {
    coneLength = std::max(meters, 1.0);
}

int Config::getConeSegments() const {
    return coneSegments;
}

void Config::setConeSegments(const int segments) {
    coneSegments = std::clamp(segments, 3, 360);
}

int Config::getSolidConeSegments() const {
    return solidConeSegments;
}

void Config::setSolidConeSegments(const int segments) {
    solidConeSegments = std::clamp(segments, 3, 360);
}

double Config::getAxisLength() const {
    return axisLength;
}

void Config::setAxisLength(const double meters) {
    axisLength = std::max(meters, 1.0);
}

double Config::getSigmaScale() const {
    return sigmaScale;
}

void Config::setSigmaScale(const double sigma) {
    if (sigma >= 0.1 && sigma <= 10.0) {
        sigmaScale = sigma;
    } else if (sigma > 10.0) {
        sigmaScale = 10.0;
    } else {
        sigmaScale = 0.1;
    }
}

UncertaintyQuality Config::getUncertaintyQuality() const {
    return quality;
}

void Config::setUncertaintyQuality(const UncertaintyQuality q) {
    quality = q;
}

OrientationInterpolation Config::getInterpolation() const {
    return interpolation;
}

void Config::setInterpolation(const OrientationInterpolation mode) {
    interpolation = mode;
}

CoordinatesType Config::getCoordinatesType() const {
    return coordinatesType;
}

void Config::setCoordinatesType(const CoordinatesType type) {
    coordinatesType = type;
}

bool Config::hasTime() const {
    return time.has_value();
}

time_point Config::getTime() const {
    return time.value_or(std::chrono::system_clock::now());
}

void Config::setTime(const time_point tp) {
    time = tp;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
