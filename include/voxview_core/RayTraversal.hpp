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

#ifndef VOXVIEW_CORE__RAYTRAVERSAL_HPP
#define VOXVIEW_CORE__RAYTRAVERSAL_HPP

/**
 * \file
 * \brief Incremental voxel traversal (3D DDA) and its three stopping rules.
 *
 * All entry points share one skeleton, ::voxview::traverse_voxels(), which
 * walks every voxel pierced by a ray in order and hands each one to a
 * visitor. The visitor decides when to stop.
 *
 * **Origin convention.** Origins are given in voxel coordinates. The ray
 * starts at \c origin + 0.5 on every axis, i.e. at the centre of voxel
 * floor(origin) when \c origin is integral. Observer positions produced by
 * the map drivers are always integral.
 */

#include <cmath>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <vector>

#include "voxview_core/Geometry.hpp"
#include "voxview_core/SemanticCodes.hpp"
#include "voxview_core/VoxelGrid.hpp"

namespace voxview
{

/**
 * \brief How a traversal ended.
 */
enum class TraversalEnd : uint8_t
{
  EXITED = 0,      ///< Left the grid without the visitor stopping it
  STOPPED = 1,     ///< The visitor asked to stop
  DEGENERATE = 2   ///< Zero-length direction; nothing was visited
};

/**
 * \brief Walk the voxels pierced by a ray.
 *
 * Classic Amanatides–Woo traversal. \p direction need not be unit length; it
 * is normalized internally. For each in-bounds voxel, starting with the
 * origin voxel, \p visit(index, code) is called; returning true stops the
 * walk. The next voxel is the neighbour across the nearest pending boundary;
 * on equal boundary distances x is preferred over y, and y over z.
 *
 * An axis whose direction component is exactly zero never advances.
 *
 * \p origin and \p direction are expected to be finite. A non-finite
 * component in either is treated like a zero direction (DEGENERATE), and an
 * origin outside the grid visits nothing (EXITED).
 *
 * \tparam Visitor Callable as bool(const Index3 &, VoxelCode).
 * \param grid Grid to traverse.
 * \param origin Ray origin in voxel coordinates (see file notes).
 * \param direction Ray direction (any non-zero length).
 * \param visit Per-voxel callback.
 * \return How the walk ended.
 */
template<typename Visitor>
TraversalEnd traverse_voxels(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction,
  Visitor && visit)
{
  const double length = direction.norm();
  if (length == 0.0 || !std::isfinite(length) || !origin.allFinite()) {
    return TraversalEnd::DEGENERATE;
  }
  const int dims[3] = {grid.nx(), grid.ny(), grid.nz()};
  for (int a = 0; a < 3; ++a) {
    if (origin[a] < 0.0 || origin[a] >= static_cast<double>(dims[a])) {
      return TraversalEnd::EXITED;
    }
  }
  const Vec3 d = direction / length;
  const Vec3 p = origin + Vec3::Constant(0.5);

  Index3 idx(
    static_cast<int>(std::floor(origin.x())),
    static_cast<int>(std::floor(origin.y())),
    static_cast<int>(std::floor(origin.z())));

  constexpr double kInf = std::numeric_limits<double>::infinity();
  int step[3];
  double t_max[3];
  double t_delta[3];
  for (int a = 0; a < 3; ++a) {
    step[a] = d[a] >= 0.0 ? 1 : -1;
    if (d[a] != 0.0) {
      const double boundary = static_cast<double>(idx[a] + (step[a] > 0 ? 1 : 0));
      t_max[a] = (boundary - p[a]) / d[a];
      t_delta[a] = std::fabs(1.0 / d[a]);
    } else {
      t_max[a] = kInf;
      t_delta[a] = kInf;
    }
  }

  while (grid.in_bounds(idx)) {
    if (visit(static_cast<const Index3 &>(idx), grid(idx.x(), idx.y(), idx.z()))) {
      return TraversalEnd::STOPPED;
    }

    int axis;
    if (t_max[0] <= t_max[1] && t_max[0] <= t_max[2]) {
      axis = 0;
    } else if (t_max[1] <= t_max[2]) {
      axis = 1;
    } else {
      axis = 2;
    }
    idx[axis] += step[axis];
    t_max[axis] += t_delta[axis];
  }
  return TraversalEnd::EXITED;
}

/**
 * \brief Green-hit rule: does the ray meet a vegetation voxel?
 *
 * \param grid Voxel grid.
 * \param origin Ray origin (voxel coordinates).
 * \param direction Ray direction (any non-zero length).
 * \param green Codes counted as vegetation.
 * \return true at the first voxel whose code is in \p green; false if the
 *         ray leaves the grid first or \p direction is zero.
 */
bool trace_green(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction,
  const CodeSet & green);

/**
 * \brief Sky rule: does the ray leave the grid through air only?
 *
 * \return true if every visited voxel is void; false at the first non-void
 *         voxel or if \p direction is zero.
 */
bool trace_sky(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction);

/**
 * \brief Target rule: can the ray from \p origin reach voxel \p target?
 *
 * The ray is aimed from \p origin at \p target (both in voxel coordinates).
 * Every visited voxel is tested for opacity before the target test, the
 * origin voxel included.
 *
 * \param opaque Codes that block the line of sight.
 * \return true when the walk enters \p target; false at the first opaque
 *         voxel or when the ray leaves the grid. A zero-length ray (origin
 *         equal to target) is trivially visible.
 */
bool trace_to_target(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Index3 & target,
  const CodeSet & opaque);

/**
 * \brief Ordered list of voxels visited by a free ray.
 *
 * \param max_voxels Stop after this many voxels (0 means unlimited).
 * \return Visited voxel indices, origin voxel first. Empty for a zero
 *         direction or an origin outside the grid.
 */
std::vector<Index3> trace_voxel_path(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction,
  std::size_t max_voxels = 0);

}  // namespace voxview

#endif  // VOXVIEW_CORE__RAYTRAVERSAL_HPP
