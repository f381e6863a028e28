#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>
#include <tuple>
#include <vector>

#include "apf_navigation_3d/neighborhood_query.hpp"

static std::vector<std::tuple<double, double, double>> sorted(
  const std::vector<Eigen::Vector3d>& points)
{
  std::vector<std::tuple<double, double, double>> out;
  for (const auto& p : points) out.emplace_back(p.x(), p.y(), p.z());
  std::sort(out.begin(), out.end());
  return out;
}

class NeighborhoodQueryTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    std::mt19937 gen(1234);
    std::uniform_real_distribution<double> u(-5.0, 5.0);

    std::vector<Eigen::Vector3d> cloud;
    for (int i = 0; i < 20000; i++) cloud.emplace_back(u(gen), u(gen), u(gen));

    grid_ = VoxelGrid::build(cloud, 0.25);
  }

  VoxelGrid grid_{0.25};
};

TEST_F(NeighborhoodQueryTest, EveryResultIsWithinRadius)
{
  const Eigen::Vector3d center(0.3, -1.2, 2.1);
  const double radius = 1.5;

  const auto result = NeighborhoodQuery::query(grid_, center, radius);

  ASSERT_FALSE(result.empty());
  for (const auto& p : result) {
    EXPECT_LE((p - center).norm(), radius);
  }
}

TEST_F(NeighborhoodQueryTest, MatchesLinearScan)
{
  std::mt19937 gen(99);
  std::uniform_real_distribution<double> u(-6.0, 6.0);
  std::uniform_real_distribution<double> r(0.0, 2.5);

  for (int i = 0; i < 50; i++)
  {
    const Eigen::Vector3d center(u(gen), u(gen), u(gen));
    const double radius = r(gen);

    EXPECT_EQ(sorted(NeighborhoodQuery::query(grid_, center, radius)),
              sorted(NeighborhoodQuery::queryLinear(grid_, center, radius)))
      << "center " << center.transpose() << " radius " << radius;
  }
}

TEST_F(NeighborhoodQueryTest, HugeRadiusReturnsWholeGrid)
{
  const auto result = NeighborhoodQuery::query(grid_, Eigen::Vector3d::Zero(), 100.0);
  EXPECT_EQ(result.size(), grid_.size());
}

TEST(NeighborhoodQuery, PointOnRadiusIsIncluded)
{
  // Cell centre (0.125, 0.125, 0.125)
  const VoxelGrid grid = VoxelGrid::build({{0.1, 0.1, 0.1}}, 0.25);
  const Eigen::Vector3d center(1.125, 0.125, 0.125);

  EXPECT_EQ(NeighborhoodQuery::query(grid, center, 1.0).size(), 1u);
  EXPECT_TRUE(NeighborhoodQuery::query(grid, center, 0.999).empty());
}

TEST(NeighborhoodQuery, ZeroRadiusOnlyColocatedPoint)
{
  const VoxelGrid grid = VoxelGrid::build({{0.1, 0.1, 0.1}, {0.6, 0.1, 0.1}}, 0.25);

  const auto hit = NeighborhoodQuery::query(grid, {0.125, 0.125, 0.125}, 0.0);
  ASSERT_EQ(hit.size(), 1u);
  EXPECT_DOUBLE_EQ(hit[0].x(), 0.125);

  EXPECT_TRUE(NeighborhoodQuery::query(grid, {0.0, 0.0, 0.0}, 0.0).empty());
}

TEST(NeighborhoodQuery, EmptyGridReturnsNothing)
{
  const VoxelGrid grid = VoxelGrid::build({}, 0.25);
  EXPECT_TRUE(NeighborhoodQuery::query(grid, Eigen::Vector3d::Zero(), 3.0).empty());
}

TEST(NeighborhoodQuery, NonFiniteCenterReturnsNothing)
{
  const VoxelGrid grid = VoxelGrid::build({{0.0, 0.0, 0.0}}, 0.25);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  EXPECT_TRUE(NeighborhoodQuery::query(grid, {nan, 0.0, 0.0}, 1.0).empty());
}

TEST(NeighborhoodQuery, RejectsNegativeRadius)
{
  const VoxelGrid grid = VoxelGrid::build({{0.0, 0.0, 0.0}}, 0.25);

  EXPECT_THROW(NeighborhoodQuery::query(grid, Eigen::Vector3d::Zero(), -1.0),
               InvalidConfiguration);
  EXPECT_THROW(NeighborhoodQuery::queryLinear(grid, Eigen::Vector3d::Zero(), -1.0),
               InvalidConfiguration);
}

TEST(NeighborhoodQuery, FarCenterDoesNotWrapIndices)
{
  const VoxelGrid grid = VoxelGrid::build({{0.1, 0.1, 0.1}}, 0.25);

  EXPECT_TRUE(NeighborhoodQuery::query(grid, {1e9, 0.0, 0.0}, 1.0).empty());
  EXPECT_TRUE(NeighborhoodQuery::query(grid, {0.0, 0.0, -1e12}, 5.0).empty());

  // Radius reaching past the index range still finds the grid point
  EXPECT_EQ(NeighborhoodQuery::query(grid, {0.0, 0.0, 0.0}, 1e10).size(), 1u);
}

TEST(NeighborhoodQuery, PointNearIndexLimitIsFound)
{
  // Cell 2147483640 is in range, the query box around it is not
  const double x = 2147483640.0;
  const VoxelGrid grid = VoxelGrid::build({{x, 0.0, 0.0}}, 1.0);
  ASSERT_EQ(grid.size(), 1u);

  const Eigen::Vector3d center(x + 0.5, 0.5, 0.5);
  const auto result = NeighborhoodQuery::query(grid, center, 10.0);

  ASSERT_EQ(result.size(), 1u);
  EXPECT_DOUBLE_EQ(result[0].x(), x + 0.5);
  EXPECT_EQ(sorted(result), sorted(NeighborhoodQuery::queryLinear(grid, center, 10.0)));
}
