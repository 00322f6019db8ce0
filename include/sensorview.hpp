/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SENSORVIEW_HPP
#define __SENSORVIEW_HPP

#include <sensorview/math.hpp>
#include <sensorview/frames.hpp>
#include <sensorview/ellipsoid.hpp>
#include <sensorview/trajectory.hpp>
#include <sensorview/footprint.hpp>
#include <sensorview/cone.hpp>
#include <sensorview/grid.hpp>
#include <sensorview/covariance.hpp>
#include <sensorview/satellite.hpp>
#include <sensorview/scenario.hpp>
#include <sensorview/config.hpp>
#include <sensorview/scene.hpp>

#endif
