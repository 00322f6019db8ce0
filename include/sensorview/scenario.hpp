/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_SCENARIO_HPP
#define __SENSORVIEW_SCENARIO_HPP

#include <sensorview/satellite.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sensorview {

/**
 * Thrown when a scenario document cannot be read at all (unreadable file,
 * malformed JSON, missing frames array). Problems with individual records
 * are logged and the record is skipped instead.
 */
class ScenarioException : public std::runtime_error {
public:
    explicit ScenarioException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Everything needed to evaluate a scene: satellites with their telemetry and
 * sensors, plus the ground stations shown alongside them.
 */
struct Scenario {
    CoordinatesType coordinates = CoordinatesType::Geodetic;
    std::vector<Satellite> satellites;
    std::vector<GroundStation> groundStations;
};

/**
 * Parses a scenario document.
 *
 * The document is an object with a "frames" array; each frame holds one
 * satellite:
 *
 *   { "name": "...",
 *     "meta": { "satelliteId", "satelliteName", "sensors": [...], "groundStations": [...] },
 *     "fields": { "Time": [...], "Longitude": [...], "Latitude": [...], "Altitude": [...],
 *                 "qx", "qy", "qz", "qs", "cov_xx", "cov_yy", "cov_zz",
 *                 "cov_xy", "cov_xz", "cov_yz" } }
 *
 * Time values are Unix milliseconds or "YYYY-MM-DD HH:MM:SS" (UTC) strings.
 * The three position columns are interpreted according to the document's
 * "coordinates" key, or `defaultCoordinates` when the key is absent.
 *
 * @throws ScenarioException on malformed JSON or a missing frames array
 */
Scenario parseScenario(const std::string &json,
                       CoordinatesType defaultCoordinates = CoordinatesType::Geodetic);

Scenario loadScenario(std::istream &s,
                      CoordinatesType defaultCoordinates = CoordinatesType::Geodetic);

/**
 * @throws ScenarioException if the file cannot be opened or parsed
 */
Scenario loadScenario(const std::string &filepath,
                      CoordinatesType defaultCoordinates = CoordinatesType::Geodetic);

}

#endif
