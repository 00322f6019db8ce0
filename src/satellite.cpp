/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <sensorview/satellite.hpp>
#include <sensorview/frames.hpp>

#include <algorithm>
#include <stdexcept>

namespace sensorview {

std::ostream& operator<<(std::ostream &os, const CoordinatesType &type) {
    switch (type) {
        case CoordinatesType::Geodetic:
            os << "Geodetic";
            break;
        case CoordinatesType::CartesianFixed:
            os << "CartesianFixed";
            break;
        case CoordinatesType::CartesianInertial:
            os << "CartesianInertial";
            break;
    }
    return os;
}

CoordinatesType parseCoordinatesType(std::string_view text) {
    if (text == "Geodetic") {
        return CoordinatesType::Geodetic;
    } else if (text == "CartesianFixed") {
        return CoordinatesType::CartesianFixed;
    } else if (text == "CartesianInertial") {
        return CoordinatesType::CartesianInertial;
    }
    throw std::invalid_argument("Invalid coordinates type: " + std::string(text));
}

Quaternion sensorWorldOrientation(const Quaternion &satelliteOrientation,
                                  const SensorDefinition &sensor) {
    return composeOrientation(satelliteOrientation.normalize(),
                              sensor.orientation.normalize()).normalize();
}

Vec3 GroundStation::toECEF() const {
    Geodetic location{
        latitudeInDegrees * DEGREES_TO_RADIANS,
        longitudeInDegrees * DEGREES_TO_RADIANS,
        altitudeInMeters
    };
    return Ellipsoid::wgs84().geodeticToCartesian(location);
}

// ============================================================================
// Satellite
// ============================================================================

// Inserts after any existing samples with the same time
template <typename T>
static void insertSample(Track<T> &track, double time, const T &value) {
    auto pos = std::upper_bound(track.begin(), track.end(), time,
        [](double t, const TimeSample<T> &sample) { return t < sample.time; });
    track.insert(pos, TimeSample<T>{time, value});
}

Satellite::Satellite(std::string id, std::string name)
    : id(std::move(id)), name(std::move(name)) {}

const std::string& Satellite::getId() const {
    return id;
}

const std::string& Satellite::getName() const {
    return name;
}

void Satellite::addSample(double julianDate, const Vec3 &position, const Quaternion &orientation) {
    insertSample(positions, julianDate, position);
    insertSample(orientations, julianDate, orientation);
}

void Satellite::addSensor(const SensorDefinition &sensor) {
    sensors.push_back(sensor);
}

void Satellite::addCovariance(double julianDate, const CovarianceMatrix &matrix) {
    insertSample(covariance, julianDate, matrix);
}

const Track<Vec3>& Satellite::getPositions() const {
    return positions;
}

const Track<Quaternion>& Satellite::getOrientations() const {
    return orientations;
}

const std::vector<SensorDefinition>& Satellite::getSensors() const {
    return sensors;
}

const Track<CovarianceMatrix>& Satellite::getCovariance() const {
    return covariance;
}

bool Satellite::hasData() const {
    return !positions.empty();
}

bool Satellite::hasCovariance() const {
    return !covariance.empty();
}

std::optional<std::pair<double, double>> Satellite::getAvailability() const {
    return availability(positions);
}

Vec3 Satellite::getPosition(double julianDate) const {
    if (positions.empty()) {
        throw NoDataException("Satellite " + id + " has no position samples");
    }
    return interpolate(positions, julianDate);
}

Quaternion Satellite::getOrientation(double julianDate, OrientationInterpolation mode) const {
    if (orientations.empty()) {
        throw NoDataException("Satellite " + id + " has no orientation samples");
    }
    return interpolateOrientation(orientations, julianDate, mode).normalize();
}

std::optional<CovarianceEpoch> Satellite::getNearestCovariance(double julianDate) const {
    auto index = findNearest(covariance, julianDate);
    if (!index) {
        return std::nullopt;
    }
    return covariance[*index];
}

void Satellite::printInfo(std::ostream &os) const {
    os << getName() << std::endl;
    os << "  ID: " << getId() << std::endl;
    os << "  Samples: " << positions.size() << std::endl;
    if (auto span = getAvailability()) {
        os << "  Start: " << formatJulianDate(span->first) << std::endl;
        os << "  Stop: " << formatJulianDate(span->second) << std::endl;
    }
    os << "  Sensors: " << sensors.size() << std::endl;
    for (const auto &sensor : sensors) {
        os << "    " << sensor.name << " (" << sensor.id << "): "
           << sensor.fovDegrees << " deg FOV" << std::endl;
    }
    os << "  Covariance Epochs: " << covariance.size() << std::endl;
    os << std::endl;
}

}
