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


#include <iostream>
#include <vector>

#include "voxview_core/ViewIndex.hpp"

using voxview::VoxelGrid;
using voxview::Vec3;
using voxview::Index3;
namespace codes = voxview::codes;
using std::cout; using std::endl;

// 04_tree_canopy: low-level tracing API, voxel path and per-observer indices
int main()
{
  VoxelGrid g(12, 12, 8);
  for (int x = 0; x < 12; ++x) {
    for (int y = 0; y < 12; ++y) {
      g(x, y, 0) = codes::kBareland;
    }
  }
  g.fill_column(8, 6, 2, 6, codes::kTree);

  const Vec3 eye(3, 6, 2);
  const auto path = voxview::trace_voxel_path(g, eye, Vec3(1.0, 0.0, 0.2), 8);
  cout << "path:";
  for (const Index3 & v : path) {
    cout << " (" << v.x() << "," << v.y() << "," << v.z() << ")=" <<
      voxview::code_name(g.at_checked(v.x(), v.y(), v.z()));
  }
  cout << "\n";

  const auto table = voxview::default_code_table();
  const auto dirs = voxview::build_ray_directions(voxview::DirectionSampling::green_view());
  cout << "rays=" << dirs.size() <<
    " GVI=" << voxview::green_view_index(g, eye, dirs, table.green) <<
    " SVI=" << voxview::sky_view_index(g, eye, dirs) << "\n";

  const auto slot = voxview::find_observer(g, 8, 6, table.view_index);
  cout << "observer in canopy column: z=" << slot.z << " valid=" << slot.valid() << endl;
  return 0;
}
