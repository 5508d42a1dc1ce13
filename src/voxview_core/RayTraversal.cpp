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


#include "voxview_core/RayTraversal.hpp"

namespace voxview
{

bool trace_green(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction,
  const CodeSet & green)
{
  const TraversalEnd end = traverse_voxels(grid, origin, direction,
      [&green](const Index3 &, VoxelCode code) {
        return green.contains(code);
      });
  return end == TraversalEnd::STOPPED;
}

bool trace_sky(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction)
{
  const TraversalEnd end = traverse_voxels(grid, origin, direction,
      [](const Index3 &, VoxelCode code) {
        return code != codes::kVoid;
      });
  return end == TraversalEnd::EXITED;
}

bool trace_to_target(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Index3 & target,
  const CodeSet & opaque)
{
  const Vec3 direction = target.cast<double>() - origin;
  if (direction.norm() == 0.0) {
    return true;
  }

  bool reached = false;
  traverse_voxels(grid, origin, direction,
    [&](const Index3 & idx, VoxelCode code) {
      if (opaque.contains(code)) {
        return true;
      }
      if (idx == target) {
        reached = true;
        return true;
      }
      return false;
    });
  return reached;
}

std::vector<Index3> trace_voxel_path(
  const VoxelGrid & grid,
  const Vec3 & origin,
  const Vec3 & direction,
  std::size_t max_voxels)
{
  std::vector<Index3> path;
  traverse_voxels(grid, origin, direction,
    [&](const Index3 & idx, VoxelCode) {
      path.push_back(idx);
      return max_voxels != 0 && path.size() >= max_voxels;
    });
  return path;
}

}  // namespace voxview
