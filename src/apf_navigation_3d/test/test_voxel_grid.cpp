#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "apf_navigation_3d/voxel_grid.hpp"

// Fine cloud filling [0, 1]^3 on a regular lattice
static std::vector<Eigen::Vector3d> denseCube(double step)
{
  std::vector<Eigen::Vector3d> cloud;
  const int n = static_cast<int>(std::round(1.0 / step));
  for (int i = 0; i <= n; i++)
    for (int j = 0; j <= n; j++)
      for (int k = 0; k <= n; k++)
        cloud.emplace_back(i * step, j * step, k * step);
  return cloud;
}

TEST(VoxelGridTest, OnePointPerOccupiedVoxel)
{
  const std::vector<Eigen::Vector3d> cloud = {
    {0.01, 0.01, 0.01},
    {0.20, 0.10, 0.05},   // same voxel as the first one
    {0.30, 0.00, 0.00},
    {-0.10, 0.00, 0.00}
  };

  const VoxelGrid grid = VoxelGrid::build(cloud, 0.25);

  ASSERT_EQ(grid.size(), 3u);
  EXPECT_TRUE(grid.isOccupied({0, 0, 0}));
  EXPECT_TRUE(grid.isOccupied({1, 0, 0}));
  EXPECT_TRUE(grid.isOccupied({-1, 0, 0}));
  EXPECT_FALSE(grid.isOccupied({0, 1, 0}));
}

TEST(VoxelGridTest, RepresentativeIsCellCenter)
{
  const VoxelGrid grid = VoxelGrid::build({{0.01, 0.24, 0.13}}, 0.25);

  const Eigen::Vector3d* p = grid.pointAt({0, 0, 0});
  ASSERT_NE(p, nullptr);
  EXPECT_DOUBLE_EQ(p->x(), 0.125);
  EXPECT_DOUBLE_EQ(p->y(), 0.125);
  EXPECT_DOUBLE_EQ(p->z(), 0.125);
}

TEST(VoxelGridTest, NegativeCoordinatesUseFloor)
{
  const VoxelGrid grid = VoxelGrid::build({{-0.01, -0.26, 0.0}}, 0.25);

  EXPECT_TRUE(grid.isOccupied({-1, -2, 0}));
  const VoxelIndex idx = grid.worldToVoxel({-0.01, -0.26, 0.0});
  EXPECT_EQ(idx.x, -1);
  EXPECT_EQ(idx.y, -2);
  EXPECT_EQ(idx.z, 0);
}

TEST(VoxelGridTest, SizeIndependentOfCloudDensity)
{
  const VoxelGrid coarse = VoxelGrid::build(denseCube(0.1), 0.25);
  const VoxelGrid fine = VoxelGrid::build(denseCube(0.02), 0.25);

  EXPECT_EQ(coarse.size(), fine.size());
}

TEST(VoxelGridTest, VoxelizationIsIdempotent)
{
  std::mt19937 gen(7);
  std::uniform_real_distribution<double> u(-3.0, 3.0);

  std::vector<Eigen::Vector3d> cloud;
  for (int i = 0; i < 2000; i++) cloud.emplace_back(u(gen), u(gen), u(gen));

  const VoxelGrid once = VoxelGrid::build(cloud, 0.25);
  const VoxelGrid twice = VoxelGrid::build(once.points(), 0.25);

  ASSERT_EQ(once.size(), twice.size());
  for (size_t i = 0; i < once.points().size(); i++) {
    EXPECT_EQ(once.points()[i], twice.points()[i]);
  }
}

TEST(VoxelGridTest, DenseCubeHasNoInteriorGaps)
{
  const VoxelGrid grid = VoxelGrid::build(denseCube(0.05), 0.25);

  // [0, 1] spans voxels 0..4 (1.0 itself lands in voxel 4)
  for (int x = 0; x < 4; x++)
    for (int y = 0; y < 4; y++)
      for (int z = 0; z < 4; z++)
        EXPECT_TRUE(grid.isOccupied({x, y, z}))
          << "gap at (" << x << ", " << y << ", " << z << ")";

  EXPECT_EQ(grid.size(), 125u);
}

TEST(VoxelGridTest, EmptyCloudGivesEmptyGrid)
{
  const VoxelGrid grid = VoxelGrid::build({}, 0.25);

  EXPECT_TRUE(grid.empty());
  EXPECT_EQ(grid.size(), 0u);
  EXPECT_TRUE(grid.points().empty());
}

TEST(VoxelGridTest, RejectsNonPositiveVoxelSize)
{
  const std::vector<Eigen::Vector3d> cloud = {{0.0, 0.0, 0.0}};

  EXPECT_THROW(VoxelGrid::build(cloud, 0.0), InvalidConfiguration);
  EXPECT_THROW(VoxelGrid::build(cloud, -0.25), InvalidConfiguration);
  EXPECT_THROW(VoxelGrid::build(cloud, std::numeric_limits<double>::quiet_NaN()),
               InvalidConfiguration);
}

TEST(VoxelGridTest, RejectsNonFinitePoint)
{
  const std::vector<Eigen::Vector3d> cloud = {
    {0.0, 0.0, 0.0},
    {std::numeric_limits<double>::infinity(), 0.0, 0.0}
  };

  EXPECT_THROW(VoxelGrid::build(cloud, 0.25), InvalidConfiguration);
}

TEST(VoxelGridTest, RejectsPointBeyondIndexRange)
{
  // 1e9 / 0.25 = 4e9 cells, past the int index range
  const std::vector<Eigen::Vector3d> cloud = {{1e9, 0.0, 0.0}, {0.1, 0.1, 0.1}};

  EXPECT_THROW(VoxelGrid::build(cloud, 0.25), InvalidConfiguration);
  EXPECT_THROW(VoxelGrid::build({{0.0, -1e9, 0.0}}, 0.25), InvalidConfiguration);

  // Same coordinate is fine with a voxel size that keeps it in range
  EXPECT_EQ(VoxelGrid::build(cloud, 1.0).size(), 2u);
}

TEST(VoxelGridTest, IndexableRangeBounds)
{
  const VoxelGrid grid(1.0);
  const double max_index = static_cast<double>(std::numeric_limits<int>::max());

  EXPECT_TRUE(grid.indexable({max_index - 1.0, 0.0, 0.0}));
  EXPECT_FALSE(grid.indexable({max_index, 0.0, 0.0}));
  EXPECT_FALSE(grid.indexable({0.0, 0.0, -max_index - 1.0}));
}
