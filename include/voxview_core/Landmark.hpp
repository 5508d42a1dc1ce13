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

#ifndef VOXVIEW_CORE__LANDMARK_HPP
#define VOXVIEW_CORE__LANDMARK_HPP

/**
 * @file Landmark.hpp
 * @brief Landmark selection, marking and visibility.
 *
 * Landmark visibility runs in two sequenced phases:
 *  1) **Preparation**: the building-volume voxels of the selected buildings
 *     are rewritten to a marker code in a copy of the grid
 *     (::voxview::mark_buildings_by_id).
 *  2) **Visibility**: every marker voxel becomes a target, every other
 *     non-void code present in the prepared grid becomes opaque, and each
 *     column reports whether any target is visible
 *     (::voxview::compute_landmark_visibility).
 *
 * Buildings are selected either by id or by the footprint that contains the
 * centre of a selection rectangle.
 */

#include <optional>
#include <stdexcept>
#include <vector>

#include "voxview_core/Geometry.hpp"
#include "voxview_core/SemanticCodes.hpp"
#include "voxview_core/ViewIndex.hpp"
#include "voxview_core/VoxelGrid.hpp"

namespace voxview
{

/**
 * @brief Raised when a grid carries no voxel with the landmark marker code.
 */
class NoLandmarkFoundError : public std::runtime_error
{
public:
  explicit NoLandmarkFoundError(VoxelCode marker);

  /// @return Marker code that was searched for.
  VoxelCode marker() const noexcept {return marker_;}

private:
  VoxelCode marker_;
};

/**
 * @brief Building footprint in the same planar frame as the selection rectangle.
 */
struct BuildingFootprint
{
  int id{0};                ///< Building identifier (matches the id raster)
  Ring exterior;            ///< Outer ring
  std::vector<Ring> holes;  ///< Courtyards and other inner rings
};

/**
 * @brief Copy of @p grid with the selected buildings marked.
 *
 * @p building_ids is a (nx, ny) raster in the external orientation; it is
 * flipped along x before use, so raster row r addresses grid column
 * x = nx - 1 - r. In every column whose id is in @p ids, building-volume
 * voxels are replaced by @p marker. Other codes are left untouched and
 * @p grid itself is never modified.
 *
 * @throw std::invalid_argument If the raster shape differs from (nx, ny).
 */
VoxelGrid mark_buildings_by_id(
  const VoxelGrid & grid,
  const BuildingIdGrid & building_ids,
  const std::vector<int> & ids,
  VoxelCode marker = codes::kLandmark);

/**
 * @brief Landmark target voxels, in row-major (x, y, z) order.
 */
std::vector<Index3> find_landmark_targets(const VoxelGrid & grid, VoxelCode marker);

/**
 * @brief Codes that block landmark rays in @p grid.
 *
 * Every code present in the grid except void and @p marker.
 */
CodeSet opaque_codes(const VoxelGrid & grid, VoxelCode marker);

/**
 * @brief Landmark visibility map of a prepared grid.
 *
 * @param grid Grid already carrying @p marker voxels.
 * @param marker Landmark marker code.
 * @param view_height_voxel Eye height (voxels).
 * @param policy Observer placement rules.
 * @param parallel Evaluate x columns in parallel.
 * @return (nx, ny) map of 0/1 values, flipped along x, NaN where no observer.
 * @throw NoLandmarkFoundError If no voxel carries @p marker.
 */
IndexMap compute_landmark_visibility(
  const VoxelGrid & grid,
  VoxelCode marker = codes::kLandmark,
  int view_height_voxel = 0,
  const ObserverPolicy & policy = default_code_table().landmark,
  bool parallel = true);

/**
 * @brief Centre of the axis-aligned bounding box of @p vertices.
 * @throw std::invalid_argument If @p vertices is empty.
 */
Vec2 rectangle_center(const std::vector<Vec2> & vertices);

/**
 * @brief Ids of the footprints containing @p point, in collection order.
 */
std::vector<int> find_buildings_containing_point(
  const std::vector<BuildingFootprint> & footprints,
  const Vec2 & point);

/**
 * @brief Parameters of a landmark visibility computation.
 *
 * Landmarks come from @ref landmark_building_ids when set; otherwise from
 * the footprints containing the centre of @ref rectangle_vertices.
 */
struct LandmarkParams
{
  double view_point_height{1.5};                       ///< Eye height (metres)
  std::optional<std::vector<int>> landmark_building_ids;  ///< Explicit landmark ids
  std::optional<std::vector<Vec2>> rectangle_vertices;    ///< Selection rectangle
  VoxelCode marker{codes::kLandmark};                  ///< Marker code for landmark voxels
  CodeTable code_table{default_code_table()};          ///< Observer placement rules
  bool parallel{true};                                 ///< Parallel over x
  ColorScale color_scale{"viridis", 0.0, 1.0, 2, 1.0}; ///< Pass-through display settings
};

/**
 * @brief Select, mark and evaluate landmark visibility over @p grid.
 *
 * @param grid Source grid (not modified).
 * @param building_ids (nx, ny) building-id raster, external orientation.
 * @param footprints Footprints used when no explicit ids are given.
 * @param meshsize Voxel edge length (metres).
 * @param params Selection and evaluation parameters.
 * @throw std::invalid_argument If neither ids nor a rectangle are provided,
 *        or on invalid mesh size / raster shape.
 * @throw NoLandmarkFoundError If the selection marks no voxel.
 */
ViewIndexResult get_landmark_visibility_map(
  const VoxelGrid & grid,
  const BuildingIdGrid & building_ids,
  const std::vector<BuildingFootprint> & footprints,
  double meshsize,
  const LandmarkParams & params);

}  // namespace voxview

#endif  // VOXVIEW_CORE__LANDMARK_HPP
