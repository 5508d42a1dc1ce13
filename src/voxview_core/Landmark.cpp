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


#include "voxview_core/Landmark.hpp"
#include <algorithm>
#include <limits>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace voxview
{

NoLandmarkFoundError::NoLandmarkFoundError(VoxelCode marker)
: std::runtime_error("No landmark with value " + std::to_string(marker) +
    " found in the voxel data"),
  marker_(marker)
{
}

VoxelGrid mark_buildings_by_id(
  const VoxelGrid & grid,
  const BuildingIdGrid & building_ids,
  const std::vector<int> & ids,
  VoxelCode marker)
{
  if (building_ids.rows() != grid.nx() || building_ids.cols() != grid.ny()) {
    throw std::invalid_argument("mark_buildings_by_id: id raster is " +
            std::to_string(building_ids.rows()) + "x" + std::to_string(building_ids.cols()) +
            ", grid is " + std::to_string(grid.nx()) + "x" + std::to_string(grid.ny()));
  }

  VoxelGrid marked = grid;
  const std::unordered_set<int> wanted(ids.begin(), ids.end());
  if (wanted.empty()) {
    return marked;
  }

  const Eigen::Index nx = building_ids.rows();
  std::size_t columns = 0;
  for (int x = 0; x < grid.nx(); ++x) {
    for (int y = 0; y < grid.ny(); ++y) {
      if (!wanted.count(building_ids(nx - 1 - x, y))) {
        continue;
      }
      ++columns;
      for (int z = 0; z < grid.nz(); ++z) {
        if (marked(x, y, z) == codes::kBuilding) {
          marked(x, y, z) = marker;
        }
      }
    }
  }
  spdlog::debug("[Landmark] {} building ids matched {} columns", wanted.size(), columns);
  return marked;
}

std::vector<Index3> find_landmark_targets(const VoxelGrid & grid, VoxelCode marker)
{
  return grid.find_all(marker);
}

CodeSet opaque_codes(const VoxelGrid & grid, VoxelCode marker)
{
  std::vector<VoxelCode> out;
  for (VoxelCode c : grid.unique_codes()) {
    if (c != codes::kVoid && c != marker) {
      out.push_back(c);
    }
  }
  return CodeSet(std::move(out));
}

IndexMap compute_landmark_visibility(
  const VoxelGrid & grid,
  VoxelCode marker,
  int view_height_voxel,
  const ObserverPolicy & policy,
  bool parallel)
{
  const auto targets = find_landmark_targets(grid, marker);
  if (targets.empty()) {
    throw NoLandmarkFoundError(marker);
  }
  const CodeSet opaque = opaque_codes(grid, marker);
  spdlog::debug("[Landmark] {} target voxels, {} opaque codes", targets.size(), opaque.size());

  MapOptions opts;
  opts.view_height_voxel = view_height_voxel;
  opts.parallel = parallel;
  return compute_visibility_map(grid, targets, opaque, policy, opts);
}

Vec2 rectangle_center(const std::vector<Vec2> & vertices)
{
  if (vertices.empty()) {
    throw std::invalid_argument("rectangle_center: no vertices");
  }
  Vec2 lo = vertices.front();
  Vec2 hi = vertices.front();
  for (const auto & v : vertices) {
    lo = lo.cwiseMin(v);
    hi = hi.cwiseMax(v);
  }
  return 0.5 * (lo + hi);
}

std::vector<int> find_buildings_containing_point(
  const std::vector<BuildingFootprint> & footprints,
  const Vec2 & point)
{
  std::vector<int> out;
  for (const auto & fp : footprints) {
    if (point_in_polygon(point, fp.exterior, fp.holes)) {
      out.push_back(fp.id);
    }
  }
  return out;
}

ViewIndexResult get_landmark_visibility_map(
  const VoxelGrid & grid,
  const BuildingIdGrid & building_ids,
  const std::vector<BuildingFootprint> & footprints,
  double meshsize,
  const LandmarkParams & params)
{
  ViewIndexResult result;
  result.view_height_voxel = view_height_in_voxels(params.view_point_height, meshsize);
  result.color_scale = params.color_scale;

  std::vector<int> ids;
  if (params.landmark_building_ids.has_value()) {
    ids = *params.landmark_building_ids;
  } else if (params.rectangle_vertices.has_value()) {
    const Vec2 center = rectangle_center(*params.rectangle_vertices);
    ids = find_buildings_containing_point(footprints, center);
    if (ids.empty()) {
      spdlog::warn("[Landmark] No building footprint contains the rectangle centre ({}, {})",
        center.x(), center.y());
    }
  } else {
    throw std::invalid_argument(
            "get_landmark_visibility_map: either landmark_building_ids or "
            "rectangle_vertices must be provided");
  }

  const VoxelGrid marked = mark_buildings_by_id(grid, building_ids, ids, params.marker);
  result.values = compute_landmark_visibility(
    marked, params.marker, result.view_height_voxel, params.code_table.landmark,
    params.parallel);

  const MapSummary s = summarize(result.values);
  spdlog::info("[Landmark] Visibility map {}x{}: {} ids, {} observers, {:.1f}% see a landmark",
    result.values.rows(), result.values.cols(), ids.size(), s.valid,
    s.valid > 0 ? 100.0 * s.mean : 0.0);
  return result;
}

}  // namespace voxview
