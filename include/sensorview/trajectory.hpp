/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_TRAJECTORY_HPP
#define __SENSORVIEW_TRAJECTORY_HPP

#include <sensorview/math.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sensorview {

/**
 * Thrown when a track with no samples is queried.
 */
class NoDataException : public std::runtime_error {
public:
    explicit NoDataException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * A single (time, value) sample. Time is a Julian Date.
 */
template <typename T>
struct TimeSample {
    double time;
    T value;
};

/**
 * Samples sorted ascending by time. Duplicate times are allowed.
 */
template <typename T>
using Track = std::vector<TimeSample<T>>;

enum class OrientationInterpolation {
    Linear,     ///< Componentwise lerp, renormalized
    Spherical   ///< Slerp
};

/**
 * Interpolates a track at `time`.
 *
 * Queries before the first sample return the first value and queries after
 * the last sample return the last value. In between, the first adjacent pair
 * (a, b) with a.time <= time <= b.time is blended by
 * f = (time - a.time) / (b.time - a.time), with f = 0 when both samples share
 * the same time.
 *
 * `blend(a, b, f)` defaults to the lerp() overload for T.
 *
 * @throws NoDataException if the track is empty
 */
template <typename T, typename Blend>
T interpolate(const Track<T> &track, double time, Blend blend) {
    if (track.empty()) {
        throw NoDataException("Cannot interpolate an empty track");
    }
    if (time <= track.front().time) {
        return track.front().value;
    }
    if (time >= track.back().time) {
        return track.back().value;
    }

    auto it = std::adjacent_find(track.begin(), track.end(),
        [time](const TimeSample<T> &a, const TimeSample<T> &b) {
            return a.time <= time && time <= b.time;
        });
    // Unreachable for a sorted track, but an unsorted one must not crash
    if (it == track.end()) {
        return track.back().value;
    }

    const auto &a = *it;
    const auto &b = *std::next(it);
    double span = b.time - a.time;
    double f = span == 0.0 ? 0.0 : (time - a.time) / span;
    return blend(a.value, b.value, f);
}

template <typename T>
T interpolate(const Track<T> &track, double time) {
    return interpolate(track, time, [](const T &a, const T &b, double f) {
        return lerp(a, b, f);
    });
}

/**
 * Interpolates an orientation track. Spherical interpolation is the default;
 * Linear reproduces componentwise blending.
 */
inline Quaternion interpolateOrientation(const Track<Quaternion> &track, double time,
        OrientationInterpolation mode = OrientationInterpolation::Spherical) {
    if (mode == OrientationInterpolation::Linear) {
        return interpolate(track, time);
    }
    return interpolate(track, time, [](const Quaternion &a, const Quaternion &b, double f) {
        return slerp(a, b, f);
    });
}

/**
 * Index of the sample closest in time to `time` (the earliest on ties),
 * or std::nullopt for an empty track.
 */
template <typename T>
std::optional<std::size_t> findNearest(const Track<T> &track, double time) {
    if (track.empty()) {
        return std::nullopt;
    }
    std::size_t nearest = 0;
    double minDelta = std::abs(track[0].time - time);
    for (std::size_t i = 1; i < track.size(); ++i) {
        double delta = std::abs(track[i].time - time);
        if (delta < minDelta) {
            minDelta = delta;
            nearest = i;
        }
    }
    return nearest;
}

/**
 * Index of the sample at or before `time`, clamped to the track bounds,
 * or std::nullopt for an empty track.
 */
template <typename T>
std::optional<std::size_t> findCurrentIndex(const Track<T> &track, double time) {
    if (track.empty()) {
        return std::nullopt;
    }
    if (time <= track.front().time) {
        return 0;
    }
    if (time >= track.back().time) {
        return track.size() - 1;
    }
    for (std::size_t i = 0; i + 1 < track.size(); ++i) {
        if (track[i].time <= time && time <= track[i + 1].time) {
            return i;
        }
    }
    return track.size() - 1;
}

/**
 * First and last sample times, or std::nullopt for an empty track.
 */
template <typename T>
std::optional<std::pair<double, double>> availability(const Track<T> &track) {
    if (track.empty()) {
        return std::nullopt;
    }
    return std::make_pair(track.front().time, track.back().time);
}

}

#endif
