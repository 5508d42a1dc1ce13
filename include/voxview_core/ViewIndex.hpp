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

#ifndef VOXVIEW_CORE__VIEWINDEX_HPP
#define VOXVIEW_CORE__VIEWINDEX_HPP

/**
 * \file
 * \brief Ground-level view indices over a semantic voxel grid.
 *
 * This header defines:
 *  - Per-observer evaluators (green view, sky view, landmark visibility).
 *  - The per-column observer search (::voxview::find_observer).
 *  - The map driver (::voxview::compute_observer_map) that evaluates every
 *    (x, y) column, in parallel over x, and assembles a 2D map.
 *  - High-level entry points taking physical parameters (metres) and
 *    returning a ::voxview::ViewIndexResult.
 *
 * Output maps have shape (nx, ny) and are flipped along x once at the end to
 * match the external raster orientation. Columns without a legal observer
 * hold NaN.
 */

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "voxview_core/Geometry.hpp"
#include "voxview_core/RayDirections.hpp"
#include "voxview_core/RayTraversal.hpp"
#include "voxview_core/SemanticCodes.hpp"
#include "voxview_core/VoxelGrid.hpp"

namespace voxview
{

// -----------------------------------------------------------------------------
// Per-observer evaluators
// -----------------------------------------------------------------------------

/**
 * \brief Fraction of \p directions that hit vegetation from \p observer.
 * \return Value in [0, 1]; NaN if \p directions is empty.
 */
double green_view_index(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Vec3> & directions,
  const CodeSet & green);

/**
 * \brief Fraction of \p directions that reach open sky from \p observer.
 * \return Value in [0, 1]; NaN if \p directions is empty.
 */
double sky_view_index(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Vec3> & directions);

/**
 * \brief True if at least one target is visible from \p observer.
 *
 * Targets are tried in order; the search stops at the first visible one.
 */
bool any_target_visible(
  const VoxelGrid & grid,
  const Vec3 & observer,
  const std::vector<Index3> & targets,
  const CodeSet & opaque);

// -----------------------------------------------------------------------------
// Observer search
// -----------------------------------------------------------------------------

/**
 * \brief Outcome of the observer search in one column.
 */
struct ObserverSlot
{
  enum class Status : uint8_t
  {
    NONE = 0,      ///< No standable-on-solid transition in the column
    EXCLUDED = 1,  ///< Lowest transition stands on an excluded support code
    VALID = 2      ///< \ref z is a legal observer cell
  };

  Status status{Status::NONE};
  int z{-1};                         ///< Cell of the transition (valid unless NONE)
  VoxelCode support{codes::kVoid};   ///< Code of the cell below \ref z

  bool valid() const {return status == Status::VALID;}
};

/**
 * \brief Locate the ground-level observer cell of column (\p x, \p y).
 *
 * Scans z upward from 1 and stops at the first cell whose code is standable
 * while the code below is not. That transition is the only candidate: if the
 * supporting code is excluded the column is reported as EXCLUDED, otherwise
 * as VALID. Higher transitions are never considered.
 *
 * \warning (\p x, \p y) must lie inside the grid.
 */
ObserverSlot find_observer(
  const VoxelGrid & grid,
  int x,
  int y,
  const ObserverPolicy & policy);

// -----------------------------------------------------------------------------
// Map driver
// -----------------------------------------------------------------------------

/**
 * \brief Options shared by all map computations.
 */
struct MapOptions
{
  int view_height_voxel{0};  ///< Eye height above the observer cell (voxels)
  bool parallel{true};       ///< Evaluate x columns on the TBB scheduler
};

/**
 * \brief Reverse the row (x) order of \p map.
 */
inline IndexMap flip_rows(const IndexMap & map)
{
  return map.colwise().reverse();
}

/**
 * \brief Evaluate every column of \p grid and assemble the flipped 2D map.
 *
 * For each (x, y), ::voxview::find_observer() selects the observer cell z;
 * \p evaluate is then called with the observer position
 * (x, y, z + view_height_voxel) and its result is stored in cell (x, y).
 * Columns without a valid observer get NaN.
 *
 * Columns are independent: with \ref MapOptions::parallel set, x is split
 * across TBB workers, each writing only its own cells. \p evaluate must be
 * safe to call concurrently.
 *
 * \tparam Evaluate Callable as double(const Vec3 & observer).
 * \return Map of shape (nx, ny), flipped along x.
 */
template<typename Evaluate>
IndexMap compute_observer_map(
  const VoxelGrid & grid,
  const ObserverPolicy & policy,
  const MapOptions & opts,
  Evaluate && evaluate)
{
  const int nx = grid.nx();
  const int ny = grid.ny();
  IndexMap map = IndexMap::Constant(nx, ny, std::numeric_limits<double>::quiet_NaN());

  auto process_rows = [&](int x_begin, int x_end) {
      for (int x = x_begin; x < x_end; ++x) {
        for (int y = 0; y < ny; ++y) {
          const ObserverSlot slot = find_observer(grid, x, y, policy);
          if (!slot.valid()) {
            continue;
          }
          const Vec3 observer(
            static_cast<double>(x),
            static_cast<double>(y),
            static_cast<double>(slot.z + opts.view_height_voxel));
          map(x, y) = evaluate(observer);
        }
      }
    };

  if (opts.parallel) {
    tbb::parallel_for(
      tbb::blocked_range<int>(0, nx),
      [&](const tbb::blocked_range<int> & r) {
        process_rows(r.begin(), r.end());
      });
  } else {
    process_rows(0, nx);
  }

  return flip_rows(map);
}

/**
 * \brief Green view index for every column.
 * \throw std::invalid_argument If \p directions is empty.
 */
IndexMap compute_gvi_map(
  const VoxelGrid & grid,
  const std::vector<Vec3> & directions,
  const CodeSet & green,
  const ObserverPolicy & policy,
  const MapOptions & opts = {});

/**
 * \brief Sky view index for every column.
 * \throw std::invalid_argument If \p directions is empty.
 */
IndexMap compute_svi_map(
  const VoxelGrid & grid,
  const std::vector<Vec3> & directions,
  const ObserverPolicy & policy,
  const MapOptions & opts = {});

/**
 * \brief Landmark visibility (0 or 1) for every column.
 *
 * \param targets Landmark voxels, tried in order per observer.
 * \param opaque Codes that block the line of sight.
 */
IndexMap compute_visibility_map(
  const VoxelGrid & grid,
  const std::vector<Index3> & targets,
  const CodeSet & opaque,
  const ObserverPolicy & policy,
  const MapOptions & opts = {});

// -----------------------------------------------------------------------------
// High-level API
// -----------------------------------------------------------------------------

/**
 * \brief Display settings handed through to external exporters.
 *
 * The engine never reads these; they travel with the result so a mesh
 * writer can colour the map consistently.
 */
struct ColorScale
{
  std::string colormap{"viridis"};  ///< Colormap name
  double vmin{0.0};                 ///< Lower bound of the colour range
  double vmax{1.0};                 ///< Upper bound of the colour range
  int num_colors{10};               ///< Number of discrete colours
  double alpha{1.0};                ///< Opacity
};

/**
 * \brief Parameters of a green or sky view computation.
 *
 * When \ref sampling is unset, each entry point uses its own band:
 * DirectionSampling::green_view() for the green view index and
 * DirectionSampling::sky_view() for the sky view index.
 */
struct ViewIndexParams
{
  double view_point_height{1.5};                  ///< Eye height (metres)
  std::optional<DirectionSampling> sampling;      ///< Ray direction set (mode default if unset)
  CodeTable code_table{default_code_table()};     ///< Code classification
  bool parallel{true};                            ///< Parallel over x
  ColorScale color_scale{};                       ///< Pass-through display settings

  /// \brief Defaults of the green view index.
  static ViewIndexParams green_view()
  {
    ViewIndexParams p;
    p.sampling = DirectionSampling::green_view();
    return p;
  }

  /// \brief Defaults of the sky view index.
  static ViewIndexParams sky_view()
  {
    ViewIndexParams p;
    p.sampling = DirectionSampling::sky_view();
    return p;
  }
};

/**
 * \brief Map plus the settings it was produced with.
 */
struct ViewIndexResult
{
  IndexMap values;           ///< (nx, ny) map, flipped along x, NaN where no observer
  int view_height_voxel{0};  ///< Eye height actually used (voxels)
  ColorScale color_scale;    ///< Copied from the request
};

/**
 * \brief Convert an eye height in metres into whole voxels.
 *
 * \return floor(\p meters / \p meshsize).
 * \throw std::invalid_argument If \p meshsize is not a positive finite number,
 *        \p meters is negative, or the result does not fit in an int.
 */
int view_height_in_voxels(double meters, double meshsize);

/**
 * \brief Green view index map of \p grid.
 *
 * \param meshsize Voxel edge length (metres).
 * \throw std::invalid_argument On invalid mesh size, height or sampling.
 */
ViewIndexResult get_green_view_index(
  const VoxelGrid & grid,
  double meshsize,
  const ViewIndexParams & params = ViewIndexParams::green_view());

/**
 * \brief Sky view index map of \p grid.
 *
 * \param meshsize Voxel edge length (metres).
 * \throw std::invalid_argument On invalid mesh size, height or sampling.
 */
ViewIndexResult get_sky_view_index(
  const VoxelGrid & grid,
  double meshsize,
  const ViewIndexParams & params = ViewIndexParams::sky_view());

// -----------------------------------------------------------------------------
// Summaries
// -----------------------------------------------------------------------------

/**
 * \brief Aggregate statistics over the valid (non-NaN) cells of a map.
 */
struct MapSummary
{
  std::size_t valid{0};    ///< Cells holding a value
  std::size_t invalid{0};  ///< NaN cells
  double mean{std::numeric_limits<double>::quiet_NaN()};
  double min{std::numeric_limits<double>::quiet_NaN()};
  double max{std::numeric_limits<double>::quiet_NaN()};
};

/// \brief Summarize \p map, skipping NaN cells.
MapSummary summarize(const IndexMap & map);

}  // namespace voxview

#endif  // VOXVIEW_CORE__VIEWINDEX_HPP
