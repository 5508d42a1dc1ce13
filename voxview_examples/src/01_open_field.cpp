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
#include <cmath>

#include "voxview_core/ViewIndex.hpp"

using voxview::VoxelGrid;
using voxview::ViewIndexParams;
using voxview::ViewIndexResult;
namespace codes = voxview::codes;
using std::cout; using std::endl;

// 01_open_field: flat grass field with a single tree, GVI and SVI at 1 m resolution
static VoxelGrid make_field(int n, int nz)
{
  VoxelGrid g(n, n, nz);
  for (int x = 0; x < n; ++x) {
    for (int y = 0; y < n; ++y) {
      g(x, y, 0) = codes::kRangeland;
    }
  }
  // Trunk-less canopy blob in the middle
  const int c = n / 2;
  for (int x = c - 1; x <= c + 1; ++x) {
    for (int y = c - 1; y <= c + 1; ++y) {
      g.fill_column(x, y, 3, 7, codes::kTree);
    }
  }
  return g;
}

int main()
{
  const double meshsize = 1.0;
  VoxelGrid g = make_field(21, 12);

  ViewIndexResult gvi = voxview::get_green_view_index(g, meshsize);
  ViewIndexResult svi = voxview::get_sky_view_index(g, meshsize);

  const auto gs = voxview::summarize(gvi.values);
  const auto ss = voxview::summarize(svi.values);
  cout << "GVI: observers=" << gs.valid << " mean=" << gs.mean << " max=" << gs.max << "\n";
  cout << "SVI: observers=" << ss.valid << " mean=" << ss.mean << " min=" << ss.min << "\n";

  // Row 0 of the output is the last x column of the grid
  const int x = 10, y = 10;
  const int row = g.nx() - 1 - x;
  cout << "under the canopy (" << x << "," << y << "): GVI=" << gvi.values(row, y) <<
    " SVI=" << svi.values(row, y) << endl;
  return 0;
}
