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
#include <limits>
#include <vector>
#include "voxview_core/RayTraversal.hpp"

using namespace voxview;

namespace
{

const CodeSet kGreen = default_code_table().green;

}  // namespace

TEST(RayTraversal_Path, StartsAtOriginAndStaysFaceConnected)
{
  VoxelGrid g(8, 8, 8);
  const auto path = trace_voxel_path(g, Vec3(1, 2, 3), Vec3(0.7, 0.3, 0.2));
  ASSERT_GE(path.size(), 2u);
  EXPECT_EQ(path.front(), Index3(1, 2, 3));
  for (std::size_t i = 1; i < path.size(); ++i) {
    const Index3 step = path[i] - path[i - 1];
    EXPECT_EQ(step.cwiseAbs().sum(), 1) << "step " << i;
    EXPECT_TRUE(g.in_bounds(path[i]));
  }
  // Leaves through the +x face
  EXPECT_EQ(path.back().x(), 7);
}

TEST(RayTraversal_Path, TiesPreferXThenY)
{
  VoxelGrid g(4, 4, 4);
  const auto path = trace_voxel_path(g, Vec3(0, 0, 0), Vec3(1, 1, 0), 3);
  ASSERT_EQ(path.size(), 3u);
  EXPECT_EQ(path[0], Index3(0, 0, 0));
  EXPECT_EQ(path[1], Index3(1, 0, 0));
  EXPECT_EQ(path[2], Index3(1, 1, 0));

  const auto diag = trace_voxel_path(g, Vec3(0, 0, 0), Vec3(0, 1, 1), 2);
  ASSERT_EQ(diag.size(), 2u);
  EXPECT_EQ(diag[1], Index3(0, 1, 0));
}

TEST(RayTraversal_Path, AxisAlignedAndDegenerate)
{
  VoxelGrid g(3, 3, 5);
  const auto up = trace_voxel_path(g, Vec3(1, 1, 0), Vec3(0, 0, 2));
  ASSERT_EQ(up.size(), 5u);
  for (int k = 0; k < 5; ++k) {
    EXPECT_EQ(up[k], Index3(1, 1, k));
  }

  EXPECT_TRUE(trace_voxel_path(g, Vec3(1, 1, 1), Vec3::Zero()).empty());
  // Origin above the grid ceiling
  EXPECT_TRUE(trace_voxel_path(g, Vec3(1, 1, 7), Vec3(0, 0, -1)).empty());
}

TEST(RayTraversal_Green, HitsVegetationThroughOtherCodes)
{
  VoxelGrid g(10, 3, 3);
  g(3, 1, 1) = codes::kBuilding;
  g(6, 1, 1) = codes::kTree;

  // Green mode does not stop on buildings
  EXPECT_TRUE(trace_green(g, Vec3(1, 1, 1), Vec3(1, 0, 0), kGreen));
  EXPECT_FALSE(trace_green(g, Vec3(1, 1, 1), Vec3(-1, 0, 0), kGreen));
  EXPECT_FALSE(trace_green(g, Vec3(1, 1, 1), Vec3(0, 0, 1), kGreen));
  EXPECT_FALSE(trace_green(g, Vec3(1, 1, 1), Vec3::Zero(), kGreen));

  // Observer standing inside a canopy voxel sees green at once
  EXPECT_TRUE(trace_green(g, Vec3(6, 1, 1), Vec3(0, 0, 1), kGreen));

  // Canopy straight overhead
  g(1, 1, 2) = codes::kTree;
  EXPECT_TRUE(trace_green(g, Vec3(1, 1, 1), Vec3(0, 0, 1), kGreen));
  EXPECT_FALSE(trace_green(g, Vec3(1, 1, 1), Vec3(0, 0, -1), kGreen));
}

TEST(RayTraversal_Sky, OpenVersusBlocked)
{
  VoxelGrid g(5, 5, 6);
  EXPECT_TRUE(trace_sky(g, Vec3(2, 2, 1), Vec3(0, 0, 1)));
  EXPECT_TRUE(trace_sky(g, Vec3(2, 2, 1), Vec3(1, 0, 1)));

  g(2, 2, 4) = codes::kTree;
  EXPECT_FALSE(trace_sky(g, Vec3(2, 2, 1), Vec3(0, 0, 1)));
  EXPECT_TRUE(trace_sky(g, Vec3(2, 2, 1), Vec3(1, 0, 1)));

  EXPECT_FALSE(trace_sky(g, Vec3(2, 2, 1), Vec3::Zero()));
  // Eye above the ceiling: nothing is visited, so the sky is open
  EXPECT_TRUE(trace_sky(g, Vec3(2, 2, 9), Vec3(0, 0, 1)));
}

TEST(RayTraversal_Target, ReachBlockedAndTrivial)
{
  VoxelGrid g(10, 3, 3);
  const CodeSet opaque{codes::kBuilding, codes::kTree};

  EXPECT_TRUE(trace_to_target(g, Vec3(1, 1, 1), Index3(8, 1, 1), opaque));

  g(4, 1, 1) = codes::kBuilding;
  EXPECT_FALSE(trace_to_target(g, Vec3(1, 1, 1), Index3(8, 1, 1), opaque));
  // Codes outside the opaque set are transparent
  EXPECT_TRUE(trace_to_target(g, Vec3(1, 1, 1), Index3(8, 1, 1), CodeSet{codes::kTree}));

  // Adjacent target, and origin == target
  EXPECT_TRUE(trace_to_target(g, Vec3(2, 1, 1), Index3(3, 1, 1), opaque));
  EXPECT_TRUE(trace_to_target(g, Vec3(4, 1, 1), Index3(4, 1, 1), opaque));

  // Target outside the grid is never reached
  EXPECT_FALSE(trace_to_target(g, Vec3(5, 1, 1), Index3(12, 1, 1), opaque));
}

TEST(RayTraversal_Origin, NonFiniteAndFarOrigins)
{
  VoxelGrid g(6, 6, 6);
  g(3, 3, 3) = codes::kTree;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  const Index3 target(3, 3, 3);
  const CodeSet opaque{codes::kBuilding};

  // Non-finite input visits nothing and reports no hit
  EXPECT_FALSE(trace_green(g, Vec3(nan, 1, 1), Vec3(1, 0, 0), kGreen));
  EXPECT_FALSE(trace_sky(g, Vec3(1, 1, 1), Vec3(inf, 0, 1)));
  EXPECT_FALSE(trace_to_target(g, Vec3(1, nan, 1), target, opaque));
  EXPECT_TRUE(trace_voxel_path(g, Vec3(1, 1, inf), Vec3(0, 0, 1)).empty());

  // Far outside the grid: nothing visited
  const Vec3 far(1e300, -1e300, 3);
  EXPECT_TRUE(trace_voxel_path(g, far, Vec3(-1, 1, 0)).empty());
  EXPECT_FALSE(trace_green(g, far, Vec3(-1, 1, 0), kGreen));
  EXPECT_FALSE(trace_to_target(g, far, target, opaque));
  EXPECT_TRUE(trace_sky(g, far, Vec3(0, 0, 1)));
}
