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

#include "voxview_core/Landmark.hpp"

using voxview::VoxelGrid;
using voxview::BuildingIdGrid;
using voxview::BuildingFootprint;
using voxview::LandmarkParams;
using voxview::Vec2;
namespace codes = voxview::codes;
using std::cout; using std::cerr; using std::endl;

// 03_landmark: tower behind a low block, selected by rectangle, then by id
int main()
{
  const int nx = 20, ny = 10, nz = 30;
  VoxelGrid g(nx, ny, nz);
  BuildingIdGrid ids = BuildingIdGrid::Zero(nx, ny);
  for (int x = 0; x < nx; ++x) {
    for (int y = 0; y < ny; ++y) {
      g(x, y, 0) = codes::kDevelopedSpace;
    }
  }
  // Tower, id 1
  for (int x = 15; x < 18; ++x) {
    for (int y = 4; y < 7; ++y) {
      g.fill_column(x, y, 0, 25, codes::kBuilding);
      ids(nx - 1 - x, y) = 1;
    }
  }
  // Low block, id 2
  for (int x = 8; x < 11; ++x) {
    for (int y = 0; y < ny; ++y) {
      g.fill_column(x, y, 0, 4, codes::kBuilding);
      ids(nx - 1 - x, y) = 2;
    }
  }

  std::vector<BuildingFootprint> footprints(2);
  footprints[0].id = 1;
  footprints[0].exterior = {Vec2(15, 4), Vec2(18, 4), Vec2(18, 7), Vec2(15, 7)};
  footprints[1].id = 2;
  footprints[1].exterior = {Vec2(8, 0), Vec2(11, 0), Vec2(11, 10), Vec2(8, 10)};

  LandmarkParams params;
  params.rectangle_vertices = std::vector<Vec2>{
    Vec2(14, 3), Vec2(19, 3), Vec2(19, 8), Vec2(14, 8)};
  try {
    const auto res = voxview::get_landmark_visibility_map(g, ids, footprints, 1.0, params);
    const auto s = voxview::summarize(res.values);
    cout << "by rectangle: " << s.valid << " observers, " << s.mean * 100.0 <<
      "% see the tower\n";
  } catch (const voxview::NoLandmarkFoundError & e) {
    cerr << e.what() << "\n";
    return 1;
  }

  LandmarkParams by_id;
  by_id.landmark_building_ids = std::vector<int>{2};
  const auto low = voxview::get_landmark_visibility_map(g, ids, footprints, 1.0, by_id);
  cout << "by id 2: mean=" << voxview::summarize(low.values).mean << endl;
  return 0;
}
