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


#include "voxview_core/RayDirections.hpp"
#include <stdexcept>
#include <string>

namespace voxview
{

std::vector<double> linspace(double start, double stop, int num, bool endpoint)
{
  std::vector<double> out;
  if (num <= 0) {return out;}
  out.reserve(static_cast<std::size_t>(num));

  const int div = endpoint ? num - 1 : num;
  if (div == 0) {
    out.push_back(start);
    return out;
  }
  const double step = (stop - start) / div;
  for (int i = 0; i < num; ++i) {
    out.push_back(start + i * step);
  }
  if (endpoint) {
    out.back() = stop;
  }
  return out;
}

std::vector<Vec3> build_ray_directions(const DirectionSampling & sampling)
{
  if (sampling.n_azimuth <= 0 || sampling.n_elevation <= 0) {
    throw std::invalid_argument("build_ray_directions: sample counts must be positive (got " +
            std::to_string(sampling.n_azimuth) + " x " +
            std::to_string(sampling.n_elevation) + ")");
  }

  const auto azimuths = linspace(0.0, 2.0 * kPi, sampling.n_azimuth, false);
  const auto elevations = linspace(
    deg2rad(sampling.elevation_min_deg),
    deg2rad(sampling.elevation_max_deg),
    sampling.n_elevation, true);

  std::vector<Vec3> dirs;
  dirs.reserve(azimuths.size() * elevations.size());
  for (double e : elevations) {
    for (double a : azimuths) {
      dirs.push_back(direction_from_angles(a, e));
    }
  }
  return dirs;
}

}  // namespace voxview
