#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "apf_navigation_3d/repulsive_force.hpp"

TEST(RepulsiveForceTest, SingleObstacleForceOpposesObstacleDirection)
{
  const Eigen::Vector3d vehicle(1.0, 2.0, 3.0);
  const Eigen::Vector3d obstacle(1.5, 2.5, 3.0);

  const Eigen::Vector3d f =
    RepulsiveForceModel::compute({obstacle}, vehicle, 2.0, 2.0);

  const Eigen::Vector3d to_obstacle = (obstacle - vehicle).normalized();
  ASSERT_GT(f.norm(), 0.0);
  EXPECT_NEAR(f.normalized().dot(to_obstacle), -1.0, 1e-12);
  EXPECT_NEAR(f.normalized().cross(to_obstacle).norm(), 0.0, 1e-12);
}

TEST(RepulsiveForceTest, MatchesInverseDistanceLaw)
{
  // d = 1, R = 2: k * (1 - 1/2) * 1 = 0.5 k along -x
  const Eigen::Vector3d f = RepulsiveForceModel::compute(
    {{1.0, 0.0, 0.0}}, Eigen::Vector3d::Zero(), 3.0, 2.0);

  EXPECT_NEAR(f.x(), -1.5, 1e-12);
  EXPECT_DOUBLE_EQ(f.y(), 0.0);
  EXPECT_DOUBLE_EQ(f.z(), 0.0);
}

TEST(RepulsiveForceTest, MagnitudeStrictlyIncreasesWhenCloser)
{
  const double gain = 1.0;
  const double radius = 3.0;

  double previous = 0.0;
  for (double d = 2.99; d > 0.01; d -= 0.01)
  {
    const Eigen::Vector3d f = RepulsiveForceModel::compute(
      {{d, 0.0, 0.0}}, Eigen::Vector3d::Zero(), gain, radius);

    EXPECT_GT(f.norm(), previous) << "at distance " << d;
    previous = f.norm();
  }
}

TEST(RepulsiveForceTest, ZeroAtAndBeyondInfluenceRadius)
{
  const Eigen::Vector3d vehicle = Eigen::Vector3d::Zero();

  EXPECT_TRUE(RepulsiveForceModel::compute(
    {{2.0, 0.0, 0.0}}, vehicle, 5.0, 2.0).isZero(0.0));
  EXPECT_TRUE(RepulsiveForceModel::compute(
    {{0.0, 7.0, 0.0}}, vehicle, 5.0, 2.0).isZero(0.0));
  EXPECT_DOUBLE_EQ(RepulsiveForceModel::magnitude(2.0, 5.0, 2.0), 0.0);
}

TEST(RepulsiveForceTest, ContributionsAddWithoutNormalization)
{
  const Eigen::Vector3d vehicle = Eigen::Vector3d::Zero();
  const Eigen::Vector3d p(0.0, 0.0, 1.0);

  const Eigen::Vector3d one = RepulsiveForceModel::compute({p}, vehicle, 1.0, 2.0);
  const Eigen::Vector3d three = RepulsiveForceModel::compute({p, p, p}, vehicle, 1.0, 2.0);

  EXPECT_NEAR((three - 3.0 * one).norm(), 0.0, 1e-12);
}

TEST(RepulsiveForceTest, SymmetricObstaclesCancel)
{
  const Eigen::Vector3d f = RepulsiveForceModel::compute(
    {{1.0, 0.0, 0.0}, {-1.0, 0.0, 0.0}}, Eigen::Vector3d::Zero(), 1.0, 2.0);

  EXPECT_NEAR(f.norm(), 0.0, 1e-12);
}

TEST(RepulsiveForceTest, VeryCloseObstacleIsClampedNotInfinite)
{
  const double tiny = 1e-9;
  const Eigen::Vector3d f = RepulsiveForceModel::compute(
    {{tiny, 0.0, 0.0}}, Eigen::Vector3d::Zero(), 1.0, 2.0);

  ASSERT_TRUE(f.allFinite());
  EXPECT_LT(f.x(), 0.0);
  EXPECT_DOUBLE_EQ(-f.x(),
    RepulsiveForceModel::magnitude(RepulsiveForceModel::kMinDistance, 1.0, 2.0));
}

TEST(RepulsiveForceTest, CoincidentObstaclePushesUpAtClampedMagnitude)
{
  const Eigen::Vector3d vehicle(0.5, 0.5, 0.5);
  const Eigen::Vector3d f = RepulsiveForceModel::compute({vehicle}, vehicle, 1.0, 2.0);

  ASSERT_TRUE(f.allFinite());
  EXPECT_DOUBLE_EQ(f.x(), 0.0);
  EXPECT_DOUBLE_EQ(f.y(), 0.0);
  EXPECT_DOUBLE_EQ(f.z(),
    RepulsiveForceModel::magnitude(RepulsiveForceModel::kMinDistance, 1.0, 2.0));
  EXPECT_GT(f.z(), 0.0);
}

TEST(RepulsiveForceTest, CoincidentObstacleAddsToOtherContributions)
{
  const Eigen::Vector3d vehicle = Eigen::Vector3d::Zero();
  const Eigen::Vector3d side(1.0, 0.0, 0.0);

  const Eigen::Vector3d alone = RepulsiveForceModel::compute({side}, vehicle, 1.0, 2.0);
  const Eigen::Vector3d both =
    RepulsiveForceModel::compute({side, vehicle}, vehicle, 1.0, 2.0);

  EXPECT_DOUBLE_EQ(both.x(), alone.x());
  EXPECT_GT(both.z(), 0.0);
}

TEST(RepulsiveForceTest, NoPointsNoForce)
{
  EXPECT_TRUE(RepulsiveForceModel::compute({}, Eigen::Vector3d::Ones(), 1.0, 2.0)
              .isZero(0.0));
}
