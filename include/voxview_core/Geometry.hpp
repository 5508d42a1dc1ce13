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

/**
 * @file Geometry.hpp
 * @brief Geometry primitives shared by the voxel visibility engine.
 *
 * Header-only. It provides:
 *  - Vector aliases used across the engine.
 *  - Spherical (azimuth, elevation) to Cartesian conversion.
 *  - Even-odd point-in-polygon tests for building footprints.
 */

#ifndef VOXVIEW_CORE__GEOMETRY_HPP
#define VOXVIEW_CORE__GEOMETRY_HPP

#include <Eigen/Core>
#include <cmath>
#include <vector>

namespace voxview
{

/**
 * @brief 3D vector alias used for ray origins and directions.
 */
using Vec3 = Eigen::Vector3d;

/**
 * @brief Integer voxel coordinates (i, j, k).
 */
using Index3 = Eigen::Vector3i;

/**
 * @brief 2D point alias used for footprints and selection rectangles.
 */
using Vec2 = Eigen::Vector2d;

/// @brief Closed or open ring of 2D vertices (closing vertex optional).
using Ring = std::vector<Vec2>;

constexpr double kPi = 3.14159265358979323846;

/// @brief Degrees to radians.
inline double deg2rad(double deg) {return deg * kPi / 180.0;}

// -----------------------------------------------------------------------------
// Spherical directions
// -----------------------------------------------------------------------------

/**
 * @brief Unit direction from azimuth and elevation angles.
 *
 * @param azimuth Angle in the XY plane measured from +X towards +Y (radians).
 * @param elevation Angle above the XY plane (radians, negative looks down).
 * @return (cos(e)·cos(a), cos(e)·sin(a), sin(e)).
 */
inline Vec3 direction_from_angles(double azimuth, double elevation)
{
  const double ce = std::cos(elevation);
  return {ce * std::cos(azimuth), ce * std::sin(azimuth), std::sin(elevation)};
}

// -----------------------------------------------------------------------------
// Polygons
// -----------------------------------------------------------------------------

/**
 * @brief Even-odd crossing test of point @p p against @p ring.
 *
 * The ring may or may not repeat its first vertex at the end. Points exactly
 * on an edge may land on either side.
 *
 * @return True if @p p is inside the ring.
 */
inline bool point_in_ring(const Vec2 & p, const Ring & ring)
{
  const std::size_t n = ring.size();
  if (n < 3) {
    return false;
  }
  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2 & a = ring[i];
    const Vec2 & b = ring[j];
    if ((a.y() > p.y()) != (b.y() > p.y())) {
      const double x_cross = a.x() + (p.y() - a.y()) * (b.x() - a.x()) / (b.y() - a.y());
      if (p.x() < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

/**
 * @brief Point-in-polygon with holes.
 *
 * @param p Query point.
 * @param exterior Outer ring.
 * @param holes Interior rings removed from the polygon.
 * @return True if @p p is inside @p exterior and outside every hole.
 */
inline bool point_in_polygon(
  const Vec2 & p,
  const Ring & exterior,
  const std::vector<Ring> & holes = {})
{
  if (!point_in_ring(p, exterior)) {
    return false;
  }
  for (const auto & h : holes) {
    if (point_in_ring(p, h)) {
      return false;
    }
  }
  return true;
}

}  // namespace voxview

#endif  // VOXVIEW_CORE__GEOMETRY_HPP
