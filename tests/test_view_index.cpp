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

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "voxview_core/ViewIndex.hpp"

using namespace voxview;

static constexpr double kEps = 1e-12;

namespace
{

VoxelGrid make_ground(int nx, int ny, int nz, VoxelCode ground = codes::kRoad)
{
  VoxelGrid g(nx, ny, nz);
  for (int x = 0; x < nx; ++x) {
    for (int y = 0; y < ny; ++y) {
      g(x, y, 0) = ground;
    }
  }
  return g;
}

bool same_map(const IndexMap & a, const IndexMap & b)
{
  if (a.rows() != b.rows() || a.cols() != b.cols()) {return false;}
  for (Eigen::Index r = 0; r < a.rows(); ++r) {
    for (Eigen::Index c = 0; c < a.cols(); ++c) {
      const bool na = std::isnan(a(r, c));
      const bool nb = std::isnan(b(r, c));
      if (na != nb || (!na && a(r, c) != b(r, c))) {return false;}
    }
  }
  return true;
}

}  // namespace

TEST(ViewIndex_Evaluators, NoGreenAnywhereIsZero)
{
  const VoxelGrid g = make_ground(6, 6, 6);
  const auto dirs = build_ray_directions(DirectionSampling::green_view());
  EXPECT_NEAR(green_view_index(g, Vec3(3, 3, 1), dirs, default_code_table().green), 0.0, kEps);
  EXPECT_TRUE(std::isnan(green_view_index(g, Vec3(3, 3, 1), {}, default_code_table().green)));
}

TEST(ViewIndex_Evaluators, SkyOpenAndRoofed)
{
  VoxelGrid g = make_ground(5, 5, 8);
  const std::vector<Vec3> vertical = {Vec3(0, 0, 1)};
  const auto sky = build_ray_directions(DirectionSampling::sky_view());

  // Fully open column: every non-negative elevation reaches the ceiling or a side
  EXPECT_NEAR(sky_view_index(g, Vec3(2, 2, 1), sky), 1.0, kEps);
  EXPECT_NEAR(sky_view_index(g, Vec3(2, 2, 1), vertical), 1.0, kEps);

  // Roof slab over the whole plot
  for (int x = 0; x < 5; ++x) {
    for (int y = 0; y < 5; ++y) {
      g(x, y, 5) = codes::kBuilding;
    }
  }
  EXPECT_NEAR(sky_view_index(g, Vec3(2, 2, 1), vertical), 0.0, kEps);
  const std::vector<Vec3> steep = {Vec3(0.01, 0.0, 1.0), Vec3(0.0, -0.01, 1.0)};
  EXPECT_NEAR(sky_view_index(g, Vec3(2, 2, 1), steep), 0.0, kEps);
}

TEST(ViewIndex_Evaluators, GreenFractionFromSingleTree)
{
  VoxelGrid g = make_ground(9, 9, 4);
  g(6, 4, 1) = codes::kTree;
  DirectionSampling s{4, 1, 0.0, 0.0};
  const auto dirs = build_ray_directions(s);
  // Only the +x ray hits the canopy
  EXPECT_NEAR(green_view_index(g, Vec3(4, 4, 1), dirs, default_code_table().green), 0.25, kEps);
}

TEST(ViewIndex_Map, ShapeFlipAndNaN)
{
  VoxelGrid g = make_ground(4, 3, 6);
  // Roof-top column at x=0, y=1: no observer
  g.fill_column(0, 1, 0, 3, codes::kBuilding);

  const auto dirs = build_ray_directions(DirectionSampling{4, 1, 10.0, 10.0});
  MapOptions opts;
  opts.parallel = false;
  const IndexMap m = compute_svi_map(g, dirs, default_code_table().view_index, opts);
  ASSERT_EQ(m.rows(), 4);
  ASSERT_EQ(m.cols(), 3);
  // x = 0 lands on the last row
  EXPECT_TRUE(std::isnan(m(3, 1)));
  EXPECT_FALSE(std::isnan(m(0, 1)));
  EXPECT_FALSE(std::isnan(m(3, 0)));
}

TEST(ViewIndex_Map, FlipRows)
{
  IndexMap m(3, 2);
  m << 1, 2,
    3, 4,
    5, 6;
  const IndexMap f = flip_rows(m);
  EXPECT_EQ(f(0, 0), 5);
  EXPECT_EQ(f(0, 1), 6);
  EXPECT_EQ(f(2, 0), 1);
  EXPECT_EQ(f(1, 1), 4);
}

TEST(ViewIndex_Map, ParallelMatchesSerialAndIsDeterministic)
{
  VoxelGrid g = make_ground(16, 12, 10, codes::kBareland);
  g.fill_column(3, 4, 1, 6, codes::kTree);
  g.fill_column(10, 2, 0, 8, codes::kBuilding);
  g.fill_column(12, 9, 0, 4, codes::kBuilding);
  for (int y = 0; y < 12; ++y) {
    g(7, y, 0) = codes::kRangeland;
  }

  const auto dirs = build_ray_directions(DirectionSampling::green_view());
  const CodeTable t = default_code_table();
  MapOptions serial;
  serial.parallel = false;
  serial.view_height_voxel = 1;
  MapOptions parallel = serial;
  parallel.parallel = true;

  const IndexMap a = compute_gvi_map(g, dirs, t.green, t.view_index, serial);
  const IndexMap b = compute_gvi_map(g, dirs, t.green, t.view_index, parallel);
  const IndexMap c = compute_gvi_map(g, dirs, t.green, t.view_index, parallel);
  EXPECT_TRUE(same_map(a, b));
  EXPECT_TRUE(same_map(b, c));
}

TEST(ViewIndex_Map, EmptyDirectionsThrow)
{
  const VoxelGrid g = make_ground(2, 2, 3);
  const CodeTable t = default_code_table();
  EXPECT_THROW(compute_gvi_map(g, {}, t.green, t.view_index), std::invalid_argument);
  EXPECT_THROW(compute_svi_map(g, {}, t.view_index), std::invalid_argument);
}

TEST(ViewIndex_Api, ViewHeightConversion)
{
  EXPECT_EQ(view_height_in_voxels(1.5, 1.0), 1);
  EXPECT_EQ(view_height_in_voxels(1.5, 0.5), 3);
  EXPECT_EQ(view_height_in_voxels(0.0, 2.0), 0);
  EXPECT_EQ(view_height_in_voxels(1.5, 2.0), 0);
  EXPECT_THROW(view_height_in_voxels(1.5, 0.0), std::invalid_argument);
  EXPECT_THROW(view_height_in_voxels(1.5, -1.0), std::invalid_argument);
  EXPECT_THROW(view_height_in_voxels(-1.0, 1.0), std::invalid_argument);
  EXPECT_THROW(
    view_height_in_voxels(1.0, std::numeric_limits<double>::quiet_NaN()),
    std::invalid_argument);
  // Result beyond the int range
  EXPECT_THROW(view_height_in_voxels(1.5, 1e-300), std::invalid_argument);
  EXPECT_THROW(
    view_height_in_voxels(std::numeric_limits<double>::infinity(), 1.0),
    std::invalid_argument);
}

TEST(ViewIndex_Api, DefaultParamsUseModeSampling)
{
  const VoxelGrid g = make_ground(9, 9, 12);

  // Default-constructed params on an open road plot
  ViewIndexParams p;
  p.parallel = false;
  const ViewIndexResult svi = get_sky_view_index(g, 1.0, p);
  const MapSummary ss = summarize(svi.values);
  EXPECT_EQ(ss.valid, 81u);
  EXPECT_DOUBLE_EQ(ss.min, 1.0);
  EXPECT_DOUBLE_EQ(ss.max, 1.0);
  EXPECT_TRUE(same_map(svi.values, get_sky_view_index(g, 1.0).values));

  VoxelGrid green = g;
  green.fill_column(4, 4, 1, 4, codes::kTree);
  const ViewIndexResult a = get_green_view_index(green, 1.0, p);
  const ViewIndexResult b = get_green_view_index(green, 1.0, ViewIndexParams::green_view());
  EXPECT_TRUE(same_map(a.values, b.values));
}

TEST(ViewIndex_Api, GreenAndSkyEntryPoints)
{
  VoxelGrid g = make_ground(10, 10, 12);
  g.fill_column(5, 5, 1, 9, codes::kTree);

  ViewIndexParams gp = ViewIndexParams::green_view();
  gp.parallel = false;
  const ViewIndexResult gvi = get_green_view_index(g, 1.0, gp);
  EXPECT_EQ(gvi.view_height_voxel, 1);
  EXPECT_EQ(gvi.values.rows(), 10);
  EXPECT_EQ(gvi.values.cols(), 10);
  EXPECT_EQ(gvi.color_scale.num_colors, 10);
  EXPECT_EQ(gvi.color_scale.colormap, "viridis");

  const MapSummary gs = summarize(gvi.values);
  EXPECT_EQ(gs.valid + gs.invalid, 100u);
  EXPECT_GT(gs.max, 0.0);
  EXPECT_LE(gs.max, 1.0);

  const ViewIndexResult svi = get_sky_view_index(g, 1.0);
  const MapSummary ss = summarize(svi.values);
  EXPECT_GT(ss.valid, 0u);
  EXPECT_GE(ss.min, 0.0);
  EXPECT_LE(ss.max, 1.0);

  EXPECT_THROW(get_sky_view_index(g, 0.0), std::invalid_argument);
  ViewIndexParams bad = ViewIndexParams::sky_view();
  bad.sampling->n_azimuth = 0;
  EXPECT_THROW(get_sky_view_index(g, 1.0, bad), std::invalid_argument);
}

TEST(ViewIndex_Summary, IgnoresNaN)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  IndexMap m(2, 2);
  m << 0.2, nan,
    0.6, 1.0;
  const MapSummary s = summarize(m);
  EXPECT_EQ(s.valid, 3u);
  EXPECT_EQ(s.invalid, 1u);
  EXPECT_NEAR(s.mean, 0.6, 1e-12);
  EXPECT_DOUBLE_EQ(s.min, 0.2);
  EXPECT_DOUBLE_EQ(s.max, 1.0);

  IndexMap all_nan = IndexMap::Constant(2, 3, nan);
  const MapSummary e = summarize(all_nan);
  EXPECT_EQ(e.valid, 0u);
  EXPECT_TRUE(std::isnan(e.mean));
}
