/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/scenario.hpp>
#include <sensorview/frames.hpp>

#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace sensorview {

namespace {

using JsonValue = rapidjson::Value;

// Returns the member if present and of the right kind
const JsonValue* findArray(const JsonValue &object, const char *name) {
    if (!object.IsObject()) {
        return nullptr;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsArray()) {
        return nullptr;
    }
    return &it->value;
}

const JsonValue* findObject(const JsonValue &object, const char *name) {
    if (!object.IsObject()) {
        return nullptr;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsObject()) {
        return nullptr;
    }
    return &it->value;
}

std::optional<std::string> getString(const JsonValue &object, const char *name) {
    if (!object.IsObject()) {
        return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsString() || it->value.GetStringLength() == 0) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<double> getNumber(const JsonValue &object, const char *name) {
    if (!object.IsObject()) {
        return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || !it->value.IsNumber()) {
        return std::nullopt;
    }
    return it->value.GetDouble();
}

// Numeric cell of a column; nulls, strings and short columns yield nullopt
std::optional<double> numberAt(const JsonValue *column, std::size_t row) {
    if (column == nullptr || row >= column->Size()) {
        return std::nullopt;
    }
    const JsonValue &cell = (*column)[static_cast<rapidjson::SizeType>(row)];
    if (!cell.IsNumber()) {
        return std::nullopt;
    }
    return cell.GetDouble();
}

// Time cell as a Julian Date: Unix milliseconds or a UTC timestamp string
std::optional<double> timeAt(const JsonValue &column, std::size_t row) {
    if (row >= column.Size()) {
        return std::nullopt;
    }
    const JsonValue &cell = column[static_cast<rapidjson::SizeType>(row)];
    if (cell.IsNumber()) {
        return unixMillisToJulianDate(cell.GetDouble());
    }
    if (cell.IsString()) {
        try {
            return toJulianDate(parseTimestamp(cell.GetString()));
        } catch (const std::invalid_argument &e) {
            warn("{}", e.what());
        }
    }
    return std::nullopt;
}

Vec3 toEarthFixed(CoordinatesType type, double a, double b, double c, double julianDate) {
    switch (type) {
        case CoordinatesType::CartesianFixed:
            return {a, b, c};
        case CoordinatesType::CartesianInertial:
            return applyRotation(inertialToEarthFixed(julianDate), Vec3{a, b, c});
        case CoordinatesType::Geodetic:
        default:
            // Longitude, Latitude, Altitude
            return Ellipsoid::wgs84().geodeticToCartesian({
                b * DEGREES_TO_RADIANS,
                a * DEGREES_TO_RADIANS,
                c
            });
    }
}

std::vector<SensorDefinition> parseSensors(const JsonValue &meta, const std::string &satelliteName) {
    std::vector<SensorDefinition> sensors;
    const JsonValue *array = findArray(meta, "sensors");
    if (array == nullptr) {
        return sensors;
    }

    for (const auto &entry : array->GetArray()) {
        auto id = getString(entry, "id");
        auto name = getString(entry, "name");
        auto fov = getNumber(entry, "fov");
        if (!id || !name || !fov) {
            warn("Invalid sensor on {} (missing id/name/fov), skipping", satelliteName);
            continue;
        }

        const JsonValue *ori = findObject(entry, "orientation");
        std::optional<double> qx, qy, qz, qw;
        if (ori != nullptr) {
            qx = getNumber(*ori, "qx");
            qy = getNumber(*ori, "qy");
            qz = getNumber(*ori, "qz");
            qw = getNumber(*ori, "qw");
        }
        if (!qx || !qy || !qz || !qw) {
            warn("Invalid orientation for sensor {}, skipping", *id);
            continue;
        }

        sensors.push_back({
            .id = *id,
            .name = *name,
            .fovDegrees = *fov,
            .orientation = {*qx, *qy, *qz, *qw},
            .color = getString(entry, "color")
        });
    }

    if (!sensors.empty()) {
        debug("Parsed {} sensor(s) for {}", sensors.size(), satelliteName);
    }
    return sensors;
}

void parseGroundStations(const JsonValue &meta, std::vector<GroundStation> &stations) {
    const JsonValue *array = findArray(meta, "groundStations");
    if (array == nullptr) {
        return;
    }

    for (const auto &entry : array->GetArray()) {
        stations.push_back({
            .id = getString(entry, "id").value_or("gs-" + std::to_string(stations.size())),
            .name = getString(entry, "name").value_or("Unknown Ground Station"),
            .latitudeInDegrees = getNumber(entry, "latitude").value_or(0.0),
            .longitudeInDegrees = getNumber(entry, "longitude").value_or(0.0),
            .altitudeInMeters = getNumber(entry, "altitude").value_or(0.0)
        });
    }
}

void parseCovariance(const JsonValue &fields, Satellite &satellite) {
    const JsonValue *timeField = findArray(fields, "Time");
    const JsonValue *xxField = findArray(fields, "cov_xx");
    const JsonValue *yyField = findArray(fields, "cov_yy");
    const JsonValue *zzField = findArray(fields, "cov_zz");
    const JsonValue *xyField = findArray(fields, "cov_xy");
    const JsonValue *xzField = findArray(fields, "cov_xz");
    const JsonValue *yzField = findArray(fields, "cov_yz");

    if (!timeField || !xxField || !yyField || !zzField) {
        debug("No covariance data for {}", satellite.getName());
        return;
    }

    for (std::size_t i = 0; i < timeField->Size(); ++i) {
        auto time = timeAt(*timeField, i);
        if (!time) {
            continue;
        }

        CovarianceMatrix matrix{
            .xx = numberAt(xxField, i).value_or(0.0),
            .yy = numberAt(yyField, i).value_or(0.0),
            .zz = numberAt(zzField, i).value_or(0.0),
            .xy = numberAt(xyField, i).value_or(0.0),
            .xz = numberAt(xzField, i).value_or(0.0),
            .yz = numberAt(yzField, i).value_or(0.0)
        };

        if (matrix.xx > 0.0 && matrix.yy > 0.0 && matrix.zz > 0.0) {
            satellite.addCovariance(*time, matrix);
        } else {
            warn("Invalid covariance for {} at index {}: non-positive variance",
                 satellite.getName(), i);
        }
    }

    if (satellite.hasCovariance()) {
        debug("Parsed {} covariance epochs for {}",
              satellite.getCovariance().size(), satellite.getName());
    }
}

std::optional<Satellite> parseSatellite(const JsonValue &frame, std::size_t index,
                                        CoordinatesType coordinates,
                                        std::vector<GroundStation> &stations) {
    static const JsonValue emptyObject(rapidjson::kObjectType);

    const JsonValue *metaPtr = findObject(frame, "meta");
    const JsonValue &meta = metaPtr != nullptr ? *metaPtr : emptyObject;

    std::string id = getString(meta, "satelliteId")
        .value_or(getString(frame, "name").value_or("satellite-" + std::to_string(index)));
    std::string name = getString(meta, "satelliteName").value_or(id);

    // Ground stations ride along in satellite frames
    parseGroundStations(meta, stations);

    const JsonValue *fieldsPtr = findObject(frame, "fields");
    if (fieldsPtr == nullptr) {
        warn("Satellite {}: Missing fields", name);
        return std::nullopt;
    }
    const JsonValue &fields = *fieldsPtr;

    const JsonValue *timeField = findArray(fields, "Time");
    const JsonValue *lonField = findArray(fields, "Longitude");
    const JsonValue *latField = findArray(fields, "Latitude");
    const JsonValue *altField = findArray(fields, "Altitude");
    if (!timeField || !lonField || !latField || !altField) {
        warn("Satellite {}: Missing required position fields", name);
        return std::nullopt;
    }

    const std::size_t numPoints = timeField->Size();
    if (numPoints == 0) {
        warn("Satellite {}: No data points", name);
        return std::nullopt;
    }

    const JsonValue *qxField = findArray(fields, "qx");
    const JsonValue *qyField = findArray(fields, "qy");
    const JsonValue *qzField = findArray(fields, "qz");
    const JsonValue *qsField = findArray(fields, "qs");
    const bool hasAttitude = qxField && qyField && qzField && qsField;

    Satellite satellite(id, name);
    for (std::size_t i = 0; i < numPoints; ++i) {
        auto time = timeAt(*timeField, i);
        auto a = numberAt(lonField, i);
        auto b = numberAt(latField, i);
        auto c = numberAt(altField, i);
        if (!time || !a || !b || !c) {
            warn("Satellite {}: Skipping incomplete sample at index {}", name, i);
            continue;
        }

        Quaternion orientation = Quaternion::identity();
        if (hasAttitude) {
            auto qx = numberAt(qxField, i);
            auto qy = numberAt(qyField, i);
            auto qz = numberAt(qzField, i);
            auto qs = numberAt(qsField, i);
            if (qx && qy && qz && qs) {
                orientation = {*qx, *qy, *qz, *qs};
            } else {
                warn("Satellite {}: Incomplete attitude at index {}, using identity", name, i);
            }
        }

        satellite.addSample(*time, toEarthFixed(coordinates, *a, *b, *c, *time), orientation);
    }

    if (!satellite.hasData()) {
        warn("Satellite {}: No valid data points", name);
        return std::nullopt;
    }

    for (const auto &sensor : parseSensors(meta, name)) {
        satellite.addSensor(sensor);
    }
    parseCovariance(fields, satellite);

    debug("Satellite {} parsed: {} points, {} sensors", name,
          satellite.getPositions().size(), satellite.getSensors().size());
    return satellite;
}

}

Scenario parseScenario(const std::string &json, CoordinatesType defaultCoordinates) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());

    if (doc.HasParseError()) {
        throw ScenarioException(std::string("Failed to parse scenario JSON: ")
            + rapidjson::GetParseError_En(doc.GetParseError())
            + " (offset " + std::to_string(doc.GetErrorOffset()) + ")");
    }

    if (!doc.IsObject() || !doc.HasMember("frames") || !doc["frames"].IsArray()) {
        throw ScenarioException("Scenario does not contain a frames array");
    }

    Scenario scenario;
    scenario.coordinates = defaultCoordinates;
    if (auto coordinates = getString(doc, "coordinates")) {
        try {
            scenario.coordinates = parseCoordinatesType(*coordinates);
        } catch (const std::invalid_argument &e) {
            throw ScenarioException(e.what());
        }
    }

    const auto frames = doc["frames"].GetArray();
    for (rapidjson::SizeType i = 0; i < frames.Size(); ++i) {
        auto satellite = parseSatellite(frames[i], i, scenario.coordinates, scenario.groundStations);
        if (satellite) {
            scenario.satellites.push_back(std::move(*satellite));
        }
    }

    info("Loaded {} satellite(s) and {} ground station(s)",
         scenario.satellites.size(), scenario.groundStations.size());
    return scenario;
}

Scenario loadScenario(std::istream &s, CoordinatesType defaultCoordinates) {
    std::stringstream buffer;
    buffer << s.rdbuf();
    return parseScenario(buffer.str(), defaultCoordinates);
}

Scenario loadScenario(const std::string &filepath, CoordinatesType defaultCoordinates) {
    std::ifstream file(filepath);
    if (!file) {
        throw ScenarioException("Unable to open scenario file: " + filepath);
    }
    return loadScenario(file, defaultCoordinates);
}

}
