/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_SCENE_HPP
#define __SENSORVIEW_SCENE_HPP

#include <sensorview/cone.hpp>
#include <sensorview/config.hpp>
#include <sensorview/covariance.hpp>
#include <sensorview/ellipsoid.hpp>
#include <sensorview/footprint.hpp>
#include <sensorview/grid.hpp>
#include <sensorview/scenario.hpp>

#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace sensorview {

/**
 * Geometry of one sensor at the query time. Everything is Earth-fixed.
 */
struct SensorGeometry {
    std::string id;
    std::string name;
    double fovDegrees;
    std::optional<std::string> color;
    Quaternion worldOrientation;
    Vec3 boresight;                         ///< Unit direction
    std::optional<Vec3> boresightGround;
    std::vector<Vec3> footprint;
    std::vector<Vec3> celestialProjection;
    ConeWireframe wireframe;
    SolidCone solidCone;
};

struct UncertaintyGeometry {
    double epochJulianDate;     ///< Time of the covariance epoch used
    double deltaSeconds;        ///< |query time - epoch time|
    EllipsoidParameters ellipsoid;
    double opacity;
};

struct SatelliteGeometry {
    std::string id;
    std::string name;
    bool available;             ///< Query time lies within the sample span
    Vec3 position;
    Geodetic geodetic;
    Quaternion orientation;
    Mat3 rotation;              ///< Attitude matrix shared by all sensors
    std::array<LineSegment, 3> bodyAxes;
    std::optional<Vec3> boresightGround;
    std::vector<SensorGeometry> sensors;
    std::optional<UncertaintyGeometry> uncertainty;
};

struct GroundStationGeometry {
    GroundStation station;
    Vec3 position;
};

/**
 * Frame-consistent evaluation of a scenario at one instant.
 */
struct SceneSnapshot {
    double julianDate;
    std::vector<SatelliteGeometry> satellites;
    std::vector<GroundStationGeometry> groundStations;
    std::optional<CelestialGrid> grid;
};

/**
 * Evaluates every satellite and sensor of `scenario` at `julianDate`.
 *
 * Satellites without samples are left out. Positions and attitudes outside
 * the sample span are clamped to the nearest sample. The attitude matrix is
 * computed once per satellite and reused for its body axes and every sensor.
 * The celestial grid is included when the configuration asks for it.
 */
SceneSnapshot evaluateScene(const Scenario &scenario, double julianDate, const Config &config);

/**
 * Writes a snapshot as a single JSON object.
 */
void writeSnapshot(std::ostream &os, const SceneSnapshot &snapshot);

/**
 * Writes a celestial grid as a single JSON object.
 */
void writeGrid(std::ostream &os, const CelestialGrid &grid);

}

#endif
