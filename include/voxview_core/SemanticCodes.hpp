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

#ifndef VOXVIEW_CORE__SEMANTICCODES_HPP
#define VOXVIEW_CORE__SEMANTICCODES_HPP

/**
 * \file
 * \brief Semantic voxel codes and the per-mode classification tables.
 *
 * A voxel grid stores one small signed integer per cell. Zero is always air;
 * negative values are volumes (tree canopy, buildings, underground) and
 * positive values are ground-surface land-cover classes. Each analysis mode
 * classifies codes through an explicit ::voxview::CodeTable instead of
 * hardcoding values at the call sites.
 */

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace voxview
{

/// \brief Scalar type stored in every voxel.
using VoxelCode = int32_t;

/**
 * \brief Canonical semantic codes.
 */
namespace codes
{
constexpr VoxelCode kVoid = 0;              ///< Air, always transparent
constexpr VoxelCode kUnderground = -1;      ///< Soil below the terrain surface
constexpr VoxelCode kTree = -2;             ///< Tree canopy volume
constexpr VoxelCode kBuilding = -3;         ///< Building volume
constexpr VoxelCode kLandmark = -30;        ///< Transient marker for landmark buildings

constexpr VoxelCode kBareland = 1;
constexpr VoxelCode kRangeland = 2;
constexpr VoxelCode kDevelopedSpace = 3;
constexpr VoxelCode kRoad = 4;
constexpr VoxelCode kTreeSurface = 5;
constexpr VoxelCode kWater = 6;
constexpr VoxelCode kAgriculture = 7;
constexpr VoxelCode kBuildingSurface = 8;
constexpr VoxelCode kReservedSurface = 9;   ///< Not produced by current builders; never walkable
}  // namespace codes

/**
 * \brief Small immutable set of voxel codes.
 *
 * Stored as a sorted, duplicate-free vector; lookups are binary searches.
 */
class CodeSet {
public:
  CodeSet() = default;

  CodeSet(std::initializer_list<VoxelCode> values)
  : values_(values)
  {
    normalize_();
  }

  explicit CodeSet(std::vector<VoxelCode> values)
  : values_(std::move(values))
  {
    normalize_();
  }

  /// \return true if \p code belongs to the set.
  inline bool contains(VoxelCode code) const
  {
    return std::binary_search(values_.begin(), values_.end(), code);
  }

  inline bool empty() const {return values_.empty();}
  inline std::size_t size() const {return values_.size();}

  /// \return Sorted, duplicate-free codes.
  const std::vector<VoxelCode> & values() const {return values_;}

  bool operator==(const CodeSet & other) const {return values_ == other.values_;}

private:
  void normalize_()
  {
    std::sort(values_.begin(), values_.end());
    values_.erase(std::unique(values_.begin(), values_.end()), values_.end());
  }

  std::vector<VoxelCode> values_;
};

/**
 * \brief Rules used to place an observer inside a column.
 *
 * An observer stands in the lowest cell whose code is in \ref standable while
 * the cell below is not. If the supporting cell is in \ref excluded_support
 * the column has no observer at all.
 */
struct ObserverPolicy
{
  CodeSet standable;         ///< Codes an observer may occupy
  CodeSet excluded_support;  ///< Supporting codes that invalidate the column
};

/**
 * \brief Versioned classification table for all analysis modes.
 *
 * The field values returned by ::voxview::default_code_table() are the
 * canonical behaviour. Callers may pass a modified copy to run the engine
 * against a different land-cover alphabet.
 */
struct CodeTable
{
  int version{0};             ///< Table revision
  CodeSet green;              ///< Codes counted as vegetation by the green view index
  ObserverPolicy view_index;  ///< Observer placement for green and sky view
  ObserverPolicy landmark;    ///< Observer placement for landmark visibility
};

/**
 * \brief Canonical code table (revision 2).
 *
 * - green: tree volume, rangeland, tree surface, agriculture.
 * - view_index: stand in air or canopy; never on buildings, agriculture or
 *   building surfaces.
 * - landmark: stand in air only; never on buildings, canopy, agriculture or
 *   building surfaces.
 */
inline CodeTable default_code_table()
{
  using namespace codes;
  CodeTable t;
  t.version = 2;
  t.green = CodeSet{kTree, kRangeland, kTreeSurface, kAgriculture};
  t.view_index.standable = CodeSet{kVoid, kTree};
  t.view_index.excluded_support = CodeSet{kBuilding, kAgriculture, kBuildingSurface,
    kReservedSurface};
  t.landmark.standable = CodeSet{kVoid};
  t.landmark.excluded_support = CodeSet{kBuilding, kTree, kAgriculture, kBuildingSurface,
    kReservedSurface};
  return t;
}

/// \return Human-readable name of \p code ("unknown" for unlisted values).
std::string code_name(VoxelCode code);

}  // namespace voxview

#endif  // VOXVIEW_CORE__SEMANTICCODES_HPP
