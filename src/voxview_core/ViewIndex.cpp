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


#include "voxview_core/ViewIndex.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace voxview
{

// -----------------------------------------------------------------------------
// Per-observer evaluators
// -----------------------------------------------------------------------------

double green_view_index(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Vec3> & directions,
  const CodeSet & green)
{
  if (directions.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  std::size_t hits = 0;
  for (const auto & d : directions) {
    if (trace_green(grid, observer, d, green)) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(directions.size());
}

double sky_view_index(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Vec3> & directions)
{
  if (directions.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  std::size_t hits = 0;
  for (const auto & d : directions) {
    if (trace_sky(grid, observer, d)) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(directions.size());
}

bool any_target_visible(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Index3> & targets,
  const CodeSet & opaque)
{
  for (const auto & target : targets) {
    if (trace_to_target(grid, observer, target, opaque)) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// Observer search
// -----------------------------------------------------------------------------

ObserverSlot find_observer(
  const VoxelGrid & grid,
  int x,
  int y,
  const ObserverPolicy & policy)
{
  ObserverSlot slot;
  for (int z = 1; z < grid.nz(); ++z) {
    const VoxelCode here = grid(x, y, z);
    const VoxelCode below = grid(x, y, z - 1);
    if (!policy.standable.contains(here) || policy.standable.contains(below)) {
      continue;
    }
    slot.z = z;
    slot.support = below;
    slot.status = policy.excluded_support.contains(below) ?
      ObserverSlot::Status::EXCLUDED : ObserverSlot::Status::VALID;
    return slot;
  }
  return slot;
}

// -----------------------------------------------------------------------------
// Map driver
// -----------------------------------------------------------------------------

IndexMap compute_gvi_map(
  const VoxelGrid & grid,
  const std::vector<Vec3> & directions,
  const CodeSet & green,
  const ObserverPolicy & policy,
  const MapOptions & opts)
{
  if (directions.empty()) {
    throw std::invalid_argument("compute_gvi_map: empty direction set");
  }
  return compute_observer_map(grid, policy, opts,
    [&](const Vec3 & observer) {
      return green_view_index(grid, observer, directions, green);
    });
}

IndexMap compute_svi_map(
  const VoxelGrid & grid,
  const std::vector<Vec3> & directions,
  const ObserverPolicy & policy,
  const MapOptions & opts)
{
  if (directions.empty()) {
    throw std::invalid_argument("compute_svi_map: empty direction set");
  }
  return compute_observer_map(grid, policy, opts,
    [&](const Vec3 & observer) {
      return sky_view_index(grid, observer, directions);
    });
}

IndexMap compute_visibility_map(
  const VoxelGrid & grid,
  const std::vector<Index3> & targets,
  const CodeSet & opaque,
  const ObserverPolicy & policy,
  const MapOptions & opts)
{
  return compute_observer_map(grid, policy, opts,
    [&](const Vec3 & observer) {
      return any_target_visible(grid, observer, targets, opaque) ? 1.0 : 0.0;
    });
}

// -----------------------------------------------------------------------------
// High-level API
// -----------------------------------------------------------------------------

int view_height_in_voxels(double meters, double meshsize)
{
  if (!std::isfinite(meshsize) || meshsize <= 0.0) {
    throw std::invalid_argument("view_height_in_voxels: meshsize must be positive (got " +
            std::to_string(meshsize) + ")");
  }
  if (!std::isfinite(meters) || meters < 0.0) {
    throw std::invalid_argument("view_height_in_voxels: height must be non-negative (got " +
            std::to_string(meters) + ")");
  }
  const double voxels = std::floor(meters / meshsize);
  if (!(voxels <= static_cast<double>(std::numeric_limits<int>::max()))) {
    throw std::invalid_argument("view_height_in_voxels: " + std::to_string(meters) +
            " m over a mesh of " + std::to_string(meshsize) + " m does not fit in a voxel count");
  }
  return static_cast<int>(voxels);
}

namespace
{

void log_summary(const char * what, const IndexMap & map)
{
  const MapSummary s = summarize(map);
  spdlog::info("[ViewIndex] {} map {}x{}: {} observers, {} columns without observer, "
    "mean {:.4f} (min {:.4f}, max {:.4f})",
    what, map.rows(), map.cols(), s.valid, s.invalid, s.mean, s.min, s.max);
}

}  // namespace

ViewIndexResult get_green_view_index(
  const VoxelGrid & grid,
  double meshsize,
  const ViewIndexParams & params)
{
  ViewIndexResult result;
  result.view_height_voxel = view_height_in_voxels(params.view_point_height, meshsize);
  result.color_scale = params.color_scale;

  const DirectionSampling sampling =
    params.sampling.value_or(DirectionSampling::green_view());
  const auto directions = build_ray_directions(sampling);
  spdlog::debug("[ViewIndex] GVI: {} rays ({} azimuth x {} elevation, {}..{} deg), "
    "eye height {} voxels, code table v{}",
    directions.size(), sampling.n_azimuth, sampling.n_elevation,
    sampling.elevation_min_deg, sampling.elevation_max_deg,
    result.view_height_voxel, params.code_table.version);

  MapOptions opts;
  opts.view_height_voxel = result.view_height_voxel;
  opts.parallel = params.parallel;
  result.values = compute_gvi_map(grid, directions, params.code_table.green,
      params.code_table.view_index, opts);

  log_summary("GVI", result.values);
  return result;
}

ViewIndexResult get_sky_view_index(
  const VoxelGrid & grid,
  double meshsize,
  const ViewIndexParams & params)
{
  ViewIndexResult result;
  result.view_height_voxel = view_height_in_voxels(params.view_point_height, meshsize);
  result.color_scale = params.color_scale;

  const DirectionSampling sampling =
    params.sampling.value_or(DirectionSampling::sky_view());
  const auto directions = build_ray_directions(sampling);
  spdlog::debug("[ViewIndex] SVI: {} rays ({} azimuth x {} elevation, {}..{} deg), "
    "eye height {} voxels",
    directions.size(), sampling.n_azimuth, sampling.n_elevation,
    sampling.elevation_min_deg, sampling.elevation_max_deg,
    result.view_height_voxel);

  MapOptions opts;
  opts.view_height_voxel = result.view_height_voxel;
  opts.parallel = params.parallel;
  result.values = compute_svi_map(grid, directions, params.code_table.view_index, opts);

  log_summary("SVI", result.values);
  return result;
}

// -----------------------------------------------------------------------------
// Summaries
// -----------------------------------------------------------------------------

MapSummary summarize(const IndexMap & map)
{
  MapSummary s;
  double sum = 0.0;
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (Eigen::Index c = 0; c < map.cols(); ++c) {
    for (Eigen::Index r = 0; r < map.rows(); ++r) {
      const double v = map(r, c);
      if (std::isnan(v)) {
        ++s.invalid;
        continue;
      }
      ++s.valid;
      sum += v;
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  if (s.valid > 0) {
    s.mean = sum / static_cast<double>(s.valid);
    s.min = lo;
    s.max = hi;
  }
  return s;
}

}  // namespace voxview
