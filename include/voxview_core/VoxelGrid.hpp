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

#ifndef VOXVIEW_CORE__VOXELGRID_HPP
#define VOXVIEW_CORE__VOXELGRID_HPP

/**
 * \file
 * \brief Dense semantic voxel grid consumed by the visibility engine.
 *
 * The grid is produced by external rasterizers (buildings, land cover,
 * canopy, terrain) and is read-only for the engine. Storage is a flat
 * C-order array indexed as ((i * ny) + j) * nz + k, so a column (i, j) is a
 * contiguous run of \c nz codes.
 */

#include <cstdint>
#include <vector>

#include <Eigen/Core>

#include "voxview_core/Geometry.hpp"
#include "voxview_core/SemanticCodes.hpp"

namespace voxview
{

/**
 * \brief 3D array of semantic codes with axes (x, y, z).
 *
 * \invariant data().size() == nx() * ny() * nz()
 */
class VoxelGrid {
public:
  /// \brief Empty 0x0x0 grid.
  VoxelGrid() = default;

  /**
   * \brief Allocate an \p nx × \p ny × \p nz grid filled with \p fill.
   * \throw std::invalid_argument If any dimension is negative.
   */
  VoxelGrid(int nx, int ny, int nz, VoxelCode fill = codes::kVoid);

  /// \name Shape
  ///@{
  inline int nx() const {return nx_;}
  inline int ny() const {return ny_;}
  inline int nz() const {return nz_;}
  inline std::size_t size() const {return data_.size();}
  inline bool empty() const {return data_.empty();}
  ///@}

  /// \return true if (i, j, k) addresses a cell of the grid.
  inline bool in_bounds(int i, int j, int k) const
  {
    return i >= 0 && i < nx_ && j >= 0 && j < ny_ && k >= 0 && k < nz_;
  }

  inline bool in_bounds(const Index3 & idx) const
  {
    return in_bounds(idx.x(), idx.y(), idx.z());
  }

  /**
   * \brief Read a voxel.
   * \warning No bounds checking is performed.
   */
  inline VoxelCode operator()(int i, int j, int k) const
  {
    return data_[offset_(i, j, k)];
  }

  /**
   * \brief Mutable voxel access.
   * \warning No bounds checking is performed.
   */
  inline VoxelCode & operator()(int i, int j, int k)
  {
    hash_dirty_ = true;
    return data_[offset_(i, j, k)];
  }

  /**
   * \brief Bounds-checked read.
   * \throw std::out_of_range If (i, j, k) is outside the grid.
   */
  VoxelCode at_checked(int i, int j, int k) const;

  /// \brief Write \p code into every cell of column (i, j) with k in [k0, k1).
  void fill_column(int i, int j, int k0, int k1, VoxelCode code);

  /// \return Const reference to the flat storage.
  const std::vector<VoxelCode> & data() const {return data_;}

  /**
   * \brief Replace the flat storage.
   * \throw std::invalid_argument If \p values.size() does not match the shape.
   */
  void set_data(std::vector<VoxelCode> values);

  /**
   * \brief Sorted list of the distinct codes present in the grid.
   */
  std::vector<VoxelCode> unique_codes() const;

  /**
   * \brief Indices of every voxel equal to \p code.
   *
   * Order is row-major over (i, j, k), k varying fastest.
   */
  std::vector<Index3> find_all(VoxelCode code) const;

  /// \return Number of voxels equal to \p code.
  std::size_t count(VoxelCode code) const;

  /// @brief 64-bit FNV-1a hash over shape and content (cached; recomputed lazily).
  std::uint64_t content_hash() const;

  /// \brief Same shape and same codes.
  bool operator==(const VoxelGrid & other) const;

private:
  inline std::size_t offset_(int i, int j, int k) const
  {
    return (static_cast<std::size_t>(i) * static_cast<std::size_t>(ny_) +
           static_cast<std::size_t>(j)) * static_cast<std::size_t>(nz_) +
           static_cast<std::size_t>(k);
  }

  int nx_{0};
  int ny_{0};
  int nz_{0};
  std::vector<VoxelCode> data_;

  mutable bool hash_dirty_{true};
  mutable std::uint64_t hash_cache_{0};
};

/**
 * \brief 2D result of a map computation with shape (nx, ny).
 *
 * Cells without a valid observer hold quiet NaN.
 */
using IndexMap = Eigen::MatrixXd;

/**
 * \brief 2D raster of building identifiers (0 means no building).
 */
using BuildingIdGrid = Eigen::MatrixXi;

}  // namespace voxview

#endif  // VOXVIEW_CORE__VOXELGRID_HPP
