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


#include "voxview_core/VoxelGrid.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace voxview
{

namespace
{
// 64-bit FNV-1a hash
inline std::uint64_t fnv1a64(
  const void * data, std::size_t n,
  std::uint64_t seed = 1469598103934665603ULL)
{
  const auto * p = static_cast<const std::uint8_t *>(data);
  std::uint64_t h = seed;
  for (std::size_t i = 0; i < n; ++i) {
    h ^= p[i];
    h *= 1099511628211ULL;
  }
  return h;
}
}  // namespace

VoxelGrid::VoxelGrid(int nx, int ny, int nz, VoxelCode fill)
{
  if (nx < 0 || ny < 0 || nz < 0) {
    throw std::invalid_argument("VoxelGrid: negative dimension (" + std::to_string(nx) + ", " +
            std::to_string(ny) + ", " + std::to_string(nz) + ")");
  }
  nx_ = nx;
  ny_ = ny;
  nz_ = nz;
  data_.assign(static_cast<std::size_t>(nx) * ny * nz, fill);
}

VoxelCode VoxelGrid::at_checked(int i, int j, int k) const
{
  if (!in_bounds(i, j, k)) {
    throw std::out_of_range("VoxelGrid::at_checked: (" + std::to_string(i) + ", " +
            std::to_string(j) + ", " + std::to_string(k) + ") outside grid");
  }
  return data_[offset_(i, j, k)];
}

void VoxelGrid::fill_column(int i, int j, int k0, int k1, VoxelCode code)
{
  k0 = std::max(k0, 0);
  k1 = std::min(k1, nz_);
  if (i < 0 || i >= nx_ || j < 0 || j >= ny_ || k0 >= k1) {return;}
  std::fill(data_.begin() + offset_(i, j, k0), data_.begin() + offset_(i, j, k1), code);
  hash_dirty_ = true;
}

void VoxelGrid::set_data(std::vector<VoxelCode> values)
{
  if (values.size() != data_.size()) {
    throw std::invalid_argument("VoxelGrid::set_data: expected " + std::to_string(data_.size()) +
            " values, got " + std::to_string(values.size()));
  }
  data_ = std::move(values);
  hash_dirty_ = true;
}

std::vector<VoxelCode> VoxelGrid::unique_codes() const
{
  std::vector<VoxelCode> out(data_.begin(), data_.end());
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::vector<Index3> VoxelGrid::find_all(VoxelCode code) const
{
  std::vector<Index3> out;
  for (int i = 0; i < nx_; ++i) {
    for (int j = 0; j < ny_; ++j) {
      const std::size_t base = offset_(i, j, 0);
      for (int k = 0; k < nz_; ++k) {
        if (data_[base + k] == code) {
          out.emplace_back(i, j, k);
        }
      }
    }
  }
  return out;
}

std::size_t VoxelGrid::count(VoxelCode code) const
{
  return static_cast<std::size_t>(std::count(data_.begin(), data_.end(), code));
}

std::uint64_t VoxelGrid::content_hash() const
{
  if (!hash_dirty_) {return hash_cache_;}
  const int dims[3] = {nx_, ny_, nz_};
  std::uint64_t h = fnv1a64(dims, sizeof(dims));
  if (!data_.empty()) {
    h = fnv1a64(data_.data(), data_.size() * sizeof(VoxelCode), h);
  }
  hash_cache_ = h;
  hash_dirty_ = false;
  return hash_cache_;
}

bool VoxelGrid::operator==(const VoxelGrid & other) const
{
  return nx_ == other.nx_ && ny_ == other.ny_ && nz_ == other.nz_ && data_ == other.data_;
}

std::string code_name(VoxelCode code)
{
  switch (code) {
    case codes::kVoid: return "void";
    case codes::kUnderground: return "underground";
    case codes::kTree: return "tree";
    case codes::kBuilding: return "building";
    case codes::kLandmark: return "landmark";
    case codes::kBareland: return "bareland";
    case codes::kRangeland: return "rangeland";
    case codes::kDevelopedSpace: return "developed space";
    case codes::kRoad: return "road";
    case codes::kTreeSurface: return "tree (ground surface)";
    case codes::kWater: return "water";
    case codes::kAgriculture: return "agriculture land";
    case codes::kBuildingSurface: return "building (ground surface)";
    case codes::kReservedSurface: return "reserved surface";
    default: break;
  }
  return "unknown";
}

}  // namespace voxview
