// Copyright 2025 Intelligent Robotics Lab
//
// This file is part of the project Easy Navigation (EasyNav in short)
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef VOXVIEW_CORE__RAYDIRECTIONS_HPP
#define VOXVIEW_CORE__RAYDIRECTIONS_HPP

#include <vector>

#include "voxview_core/Geometry.hpp"

namespace voxview
{

/**
 * \brief Angular sampling of a ray direction set.
 *
 * Azimuths are spaced evenly over [0, 2π) with the endpoint excluded.
 * Elevations are spaced evenly over [elevation_min_deg, elevation_max_deg]
 * with both endpoints included.
 */
struct DirectionSampling
{
  int n_azimuth{60};               ///< Number of azimuth samples
  int n_elevation{10};             ///< Number of elevation samples
  double elevation_min_deg{-30.0}; ///< Lowest elevation (degrees)
  double elevation_max_deg{30.0};  ///< Highest elevation (degrees)

  /// \brief Near-horizontal band used by the green view index (60 × 10, −30°…30°).
  static DirectionSampling green_view() {return {60, 10, -30.0, 30.0};}

  /// \brief Upward cone used by the sky view index (60 × 5, 0°…30°).
  static DirectionSampling sky_view() {return {60, 5, 0.0, 30.0};}

  /// \return Number of directions the set will contain.
  int count() const {return n_azimuth * n_elevation;}
};

/**
 * \brief Evenly spaced samples in the style of numpy.linspace.
 *
 * \param start First value.
 * \param stop Last value (included only when \p endpoint is true).
 * \param num Number of samples (0 yields an empty vector).
 * \param endpoint Include \p stop as the last sample.
 */
std::vector<double> linspace(double start, double stop, int num, bool endpoint = true);

/**
 * \brief Build the unit direction set for \p sampling.
 *
 * Order is elevation-major, azimuth-minor: all azimuths of the first
 * elevation come first.
 *
 * \throw std::invalid_argument If a sample count is not positive.
 */
std::vector<Vec3> build_ray_directions(const DirectionSampling & sampling);

}  // namespace voxview

#endif  // VOXVIEW_CORE__RAYDIRECTIONS_HPP
