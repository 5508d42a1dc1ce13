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
using voxview::DirectionSampling;
namespace codes = voxview::codes;
using std::cout; using std::endl;

// 02_street_canyon: road between two building blocks, SVI along the canyon axis
int main()
{
  const double meshsize = 2.0;
  const int nx = 15, ny = 6, nz = 20;
  VoxelGrid g(nx, ny, nz);
  for (int x = 0; x < nx; ++x) {
    for (int y = 0; y < ny; ++y) {
      g(x, y, 0) = codes::kRoad;
    }
    // Blocks on both sides of the street, 12 voxels tall
    for (int y : {0, 1, 4, 5}) {
      g.fill_column(x, y, 0, 12, codes::kBuilding);
    }
  }

  ViewIndexParams params = ViewIndexParams::sky_view();
  params.sampling = DirectionSampling{36, 5, 0.0, 60.0};
  const auto svi = voxview::get_sky_view_index(g, meshsize, params);

  cout << "eye height: " << svi.view_height_voxel << " voxels\n";
  for (int y = 0; y < ny; ++y) {
    const double v = svi.values(nx / 2, y);
    cout << "y=" << y << " SVI=";
    if (std::isnan(v)) {cout << "n/a (rooftop)";} else {cout << v;}
    cout << "\n";
  }

  voxview::ViewIndexParams serial = params;
  serial.parallel = false;
  const auto check = voxview::get_sky_view_index(g, meshsize, serial);
  int diff = 0;
  for (int r = 0; r < nx; ++r) {
    for (int c = 0; c < ny; ++c) {
      const double a = check.values(r, c), b = svi.values(r, c);
      if (!(a == b || (std::isnan(a) && std::isnan(b)))) {++diff;}
    }
  }
  cout << "cells differing between serial and parallel: " << diff << endl;
  return 0;
}
