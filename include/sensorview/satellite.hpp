/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_SATELLITE_HPP
#define __SENSORVIEW_SATELLITE_HPP

#include <sensorview/covariance.hpp>
#include <sensorview/ellipsoid.hpp>
#include <sensorview/math.hpp>
#include <sensorview/trajectory.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sensorview {

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * How the three position columns of a telemetry frame are interpreted.
 */
enum class CoordinatesType {
    Geodetic,           ///< Longitude (deg), Latitude (deg), Altitude (m)
    CartesianFixed,     ///< Earth-fixed X, Y, Z (m)
    CartesianInertial   ///< Inertial X, Y, Z (m), rotated to Earth-fixed per sample
};

std::ostream& operator<<(std::ostream &os, const CoordinatesType &type);

/**
 * Parses "Geodetic", "CartesianFixed" or "CartesianInertial".
 * @throws std::invalid_argument for any other value
 */
CoordinatesType parseCoordinatesType(std::string_view text);

/**
 * A sensor rigidly mounted on a satellite. The boresight is the sensor's +Z
 * axis; `orientation` takes sensor-frame vectors into the satellite body frame.
 */
struct SensorDefinition {
    std::string id;
    std::string name;
    double fovDegrees;                  ///< Full field of view
    Quaternion orientation;             ///< Offset relative to the satellite body
    std::optional<std::string> color;   ///< Passed through to the host

    double halfAngleDegrees() const { return fovDegrees / 2.0; }
};

/**
 * Sensor orientation in the world frame: the sensor offset is applied first,
 * then the satellite attitude. The result is normalized.
 */
Quaternion sensorWorldOrientation(const Quaternion &satelliteOrientation,
                                  const SensorDefinition &sensor);

struct GroundStation {
    std::string id;
    std::string name;
    double latitudeInDegrees;
    double longitudeInDegrees;
    double altitudeInMeters;    ///< Terrain plus antenna height

    /** Earth-fixed position on the WGS84 ellipsoid. */
    Vec3 toECEF() const;
};

/**
 * Position covariance valid at a Julian Date.
 */
using CovarianceEpoch = TimeSample<CovarianceMatrix>;

// ============================================================================
// Satellite
// ============================================================================

/**
 * A satellite described by sampled telemetry: Earth-fixed positions, attitude
 * quaternions, mounted sensors and optional covariance epochs.
 *
 * Samples may be added in any order; tracks are kept sorted by time, and
 * samples with equal times keep their insertion order.
 */
class Satellite {
public:
    Satellite() = default;
    Satellite(std::string id, std::string name);
    ~Satellite() = default;

    const std::string& getId() const;
    const std::string& getName() const;

    void addSample(double julianDate, const Vec3 &position, const Quaternion &orientation);
    void addSensor(const SensorDefinition &sensor);
    void addCovariance(double julianDate, const CovarianceMatrix &covariance);

    const Track<Vec3>& getPositions() const;
    const Track<Quaternion>& getOrientations() const;
    const std::vector<SensorDefinition>& getSensors() const;
    const Track<CovarianceMatrix>& getCovariance() const;

    bool hasData() const;
    bool hasCovariance() const;

    /**
     * First and last sample times, or std::nullopt without samples.
     */
    std::optional<std::pair<double, double>> getAvailability() const;

    /**
     * Interpolated Earth-fixed position (m).
     * @throws NoDataException if the satellite has no samples
     */
    Vec3 getPosition(double julianDate) const;

    /**
     * Interpolated attitude, normalized.
     * @throws NoDataException if the satellite has no samples
     */
    Quaternion getOrientation(double julianDate,
            OrientationInterpolation mode = OrientationInterpolation::Spherical) const;

    /**
     * Covariance epoch closest in time, or std::nullopt without covariance.
     */
    std::optional<CovarianceEpoch> getNearestCovariance(double julianDate) const;

    /**
     * Print a summary of the satellite to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    std::string id;
    std::string name;
    Track<Vec3> positions;
    Track<Quaternion> orientations;
    std::vector<SensorDefinition> sensors;
    Track<CovarianceMatrix> covariance;
};

}

#endif
