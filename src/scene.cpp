/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/scene.hpp>
#include <sensorview/frames.hpp>

#include <cmath>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace sensorview {

constexpr double SECONDS_PER_DAY = 86400.0;

namespace {

SensorGeometry evaluateSensor(const SensorDefinition &sensor, const Vec3 &position,
                              const Quaternion &orientation, const Mat3 &rotation,
                              const Config &config) {
    SensorGeometry geometry{};
    geometry.id = sensor.id;
    geometry.name = sensor.name;
    geometry.fovDegrees = sensor.fovDegrees;
    geometry.color = sensor.color;
    geometry.worldOrientation = sensorWorldOrientation(orientation, sensor);

    // Sensor +Z in the body frame, then into the world with the shared matrix
    Vec3 bodyBoresight = sensor.orientation.rotate(UNIT_Z);
    geometry.boresight = applyRotation(rotation, bodyBoresight).normalize();

    const Ellipsoid earth = Ellipsoid::wgs84();
    const double halfAngle = sensor.halfAngleDegrees();

    geometry.boresightGround = intersect(position, geometry.boresight, earth);
    geometry.footprint = computeFootprint(position, geometry.boresight, halfAngle,
                                          earth, config.getFootprintOptions());
    geometry.celestialProjection = computeCelestialProjection(position, geometry.boresight,
                                                              halfAngle,
                                                              config.getCelestialRadius());
    geometry.wireframe = generateConeWireframe(position, geometry.boresight, halfAngle,
                                               config.getConeLength(), config.getConeSegments());
    geometry.solidCone = generateSolidCone(position, geometry.boresight, halfAngle,
                                           config.getConeLength(), config.getSolidConeSegments());
    return geometry;
}

std::optional<UncertaintyGeometry> evaluateUncertainty(const Satellite &satellite,
                                                       double julianDate,
                                                       const Config &config) {
    auto epoch = satellite.getNearestCovariance(julianDate);
    if (!epoch) {
        return std::nullopt;
    }
    return UncertaintyGeometry{
        .epochJulianDate = epoch->time,
        .deltaSeconds = std::abs(epoch->time - julianDate) * SECONDS_PER_DAY,
        .ellipsoid = covarianceToEllipsoid(epoch->value, config.getSigmaScale()),
        .opacity = opacityForQuality(config.getUncertaintyQuality())
    };
}

SatelliteGeometry evaluateSatellite(const Satellite &satellite, double julianDate,
                                    const Config &config) {
    SatelliteGeometry geometry{};
    geometry.id = satellite.getId();
    geometry.name = satellite.getName();

    auto span = satellite.getAvailability();
    geometry.available = span && julianDate >= span->first && julianDate <= span->second;

    geometry.position = satellite.getPosition(julianDate);
    geometry.geodetic = Ellipsoid::wgs84().cartesianToGeodetic(geometry.position);
    geometry.orientation = satellite.getOrientation(julianDate, config.getInterpolation());
    geometry.rotation = geometry.orientation.toRotationMatrix();
    geometry.bodyAxes = computeBodyAxes(geometry.position, geometry.rotation, config.getAxisLength());
    geometry.boresightGround = intersect(geometry.position, geometry.rotation.column(2),
                                         Ellipsoid::wgs84());

    for (const auto &sensor : satellite.getSensors()) {
        geometry.sensors.push_back(evaluateSensor(sensor, geometry.position, geometry.orientation,
                                                  geometry.rotation, config));
    }

    geometry.uncertainty = evaluateUncertainty(satellite, julianDate, config);
    return geometry;
}

}

SceneSnapshot evaluateScene(const Scenario &scenario, double julianDate, const Config &config) {
    SceneSnapshot snapshot{};
    snapshot.julianDate = julianDate;

    for (const auto &satellite : scenario.satellites) {
        if (!satellite.hasData()) {
            debug("Skipping {}: no samples", satellite.getName());
            continue;
        }
        snapshot.satellites.push_back(evaluateSatellite(satellite, julianDate, config));
        debug("Evaluated {} with {} sensor(s)", satellite.getName(),
              satellite.getSensors().size());
    }

    for (const auto &station : scenario.groundStations) {
        snapshot.groundStations.push_back({station, station.toECEF()});
    }

    if (config.getShowGrid()) {
        snapshot.grid = generateGrid({
            .raSpacingHours = config.getRASpacing(),
            .decSpacingDegrees = config.getDecSpacing(),
            .radius = config.getCelestialRadius(),
            .referenceJulianDate = julianDate,
            .samplesPerLine = config.getGridSamples()
        });
    }

    return snapshot;
}

// ============================================================================
// JSON Output
// ============================================================================

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeVec3(JsonWriter &writer, const Vec3 &v) {
    writer.StartArray();
    writer.Double(v.x);
    writer.Double(v.y);
    writer.Double(v.z);
    writer.EndArray();
}

void writeOptionalVec3(JsonWriter &writer, const std::optional<Vec3> &v) {
    if (v) {
        writeVec3(writer, *v);
    } else {
        writer.Null();
    }
}

void writeQuaternion(JsonWriter &writer, const Quaternion &q) {
    writer.StartArray();
    writer.Double(q.x);
    writer.Double(q.y);
    writer.Double(q.z);
    writer.Double(q.w);
    writer.EndArray();
}

void writePoints(JsonWriter &writer, const std::vector<Vec3> &points) {
    writer.StartArray();
    for (const auto &p : points) {
        writeVec3(writer, p);
    }
    writer.EndArray();
}

void writeSegment(JsonWriter &writer, const LineSegment &segment) {
    writer.StartArray();
    writeVec3(writer, segment.start);
    writeVec3(writer, segment.end);
    writer.EndArray();
}

void writeGridObject(JsonWriter &writer, const CelestialGrid &grid) {
    writer.StartObject();
    writer.Key("raLines");
    writer.StartArray();
    for (const auto &line : grid.raLines) {
        writePoints(writer, line);
    }
    writer.EndArray();
    writer.Key("decLines");
    writer.StartArray();
    for (const auto &line : grid.decLines) {
        writePoints(writer, line);
    }
    writer.EndArray();
    writer.Key("labels");
    writer.StartArray();
    for (const auto &label : grid.labels) {
        writer.StartObject();
        writer.Key("text");
        writer.String(label.text.c_str(), static_cast<rapidjson::SizeType>(label.text.size()));
        writer.Key("position");
        writeVec3(writer, label.position);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

void writeSensor(JsonWriter &writer, const SensorGeometry &sensor) {
    writer.StartObject();
    writer.Key("id");
    writer.String(sensor.id.c_str());
    writer.Key("name");
    writer.String(sensor.name.c_str());
    writer.Key("fov");
    writer.Double(sensor.fovDegrees);
    if (sensor.color) {
        writer.Key("color");
        writer.String(sensor.color->c_str());
    }
    writer.Key("orientation");
    writeQuaternion(writer, sensor.worldOrientation);
    writer.Key("boresight");
    writeVec3(writer, sensor.boresight);
    writer.Key("boresightGround");
    writeOptionalVec3(writer, sensor.boresightGround);
    writer.Key("footprint");
    writePoints(writer, sensor.footprint);
    writer.Key("celestialProjection");
    writePoints(writer, sensor.celestialProjection);

    writer.Key("wireframe");
    writer.StartObject();
    writer.Key("rimRadius");
    writer.Double(sensor.wireframe.rimRadius);
    writer.Key("spokes");
    writer.StartArray();
    for (const auto &spoke : sensor.wireframe.spokes) {
        writeSegment(writer, spoke);
    }
    writer.EndArray();
    writer.Key("rim");
    writePoints(writer, sensor.wireframe.rim);
    writer.EndObject();

    writer.Key("solidCone");
    writer.StartObject();
    writer.Key("rimRadius");
    writer.Double(sensor.solidCone.rimRadius);
    writer.Key("triangles");
    writer.StartArray();
    for (const auto &triangle : sensor.solidCone.triangles) {
        writer.StartArray();
        writeVec3(writer, triangle.a);
        writeVec3(writer, triangle.b);
        writeVec3(writer, triangle.c);
        writer.EndArray();
    }
    writer.EndArray();
    writer.EndObject();

    writer.EndObject();
}

void writeSatellite(JsonWriter &writer, const SatelliteGeometry &satellite) {
    writer.StartObject();
    writer.Key("id");
    writer.String(satellite.id.c_str());
    writer.Key("name");
    writer.String(satellite.name.c_str());
    writer.Key("available");
    writer.Bool(satellite.available);
    writer.Key("position");
    writeVec3(writer, satellite.position);

    writer.Key("geodetic");
    writer.StartObject();
    writer.Key("latitude");
    writer.Double(satellite.geodetic.latInRadians * RADIANS_TO_DEGREES);
    writer.Key("longitude");
    writer.Double(satellite.geodetic.lonInRadians * RADIANS_TO_DEGREES);
    writer.Key("altitude");
    writer.Double(satellite.geodetic.altInMeters);
    writer.EndObject();

    writer.Key("orientation");
    writeQuaternion(writer, satellite.orientation);
    writer.Key("bodyAxes");
    writer.StartArray();
    for (const auto &axis : satellite.bodyAxes) {
        writeSegment(writer, axis);
    }
    writer.EndArray();
    writer.Key("boresightGround");
    writeOptionalVec3(writer, satellite.boresightGround);

    writer.Key("sensors");
    writer.StartArray();
    for (const auto &sensor : satellite.sensors) {
        writeSensor(writer, sensor);
    }
    writer.EndArray();

    if (satellite.uncertainty) {
        const auto &u = *satellite.uncertainty;
        writer.Key("uncertainty");
        writer.StartObject();
        writer.Key("epoch");
        writer.String(formatJulianDate(u.epochJulianDate).c_str());
        writer.Key("deltaSeconds");
        writer.Double(u.deltaSeconds);
        writer.Key("radii");
        writeVec3(writer, u.ellipsoid.radii);
        writer.Key("orientation");
        writeQuaternion(writer, u.ellipsoid.orientation);
        writer.Key("opacity");
        writer.Double(u.opacity);
        writer.EndObject();
    }

    writer.EndObject();
}

}

void writeSnapshot(std::ostream &os, const SceneSnapshot &snapshot) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("time");
    writer.String(formatJulianDate(snapshot.julianDate).c_str());
    writer.Key("julianDate");
    writer.Double(snapshot.julianDate);

    writer.Key("satellites");
    writer.StartArray();
    for (const auto &satellite : snapshot.satellites) {
        writeSatellite(writer, satellite);
    }
    writer.EndArray();

    writer.Key("groundStations");
    writer.StartArray();
    for (const auto &gs : snapshot.groundStations) {
        writer.StartObject();
        writer.Key("id");
        writer.String(gs.station.id.c_str());
        writer.Key("name");
        writer.String(gs.station.name.c_str());
        writer.Key("latitude");
        writer.Double(gs.station.latitudeInDegrees);
        writer.Key("longitude");
        writer.Double(gs.station.longitudeInDegrees);
        writer.Key("altitude");
        writer.Double(gs.station.altitudeInMeters);
        writer.Key("position");
        writeVec3(writer, gs.position);
        writer.EndObject();
    }
    writer.EndArray();

    if (snapshot.grid) {
        writer.Key("grid");
        writeGridObject(writer, *snapshot.grid);
    }

    writer.EndObject();
    os << buffer.GetString() << std::endl;
}

void writeGrid(std::ostream &os, const CelestialGrid &grid) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writeGridObject(writer, grid);
    os << buffer.GetString() << std::endl;
}

}
