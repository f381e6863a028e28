#pragma once
#include <cmath>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "apf_errors.hpp"
#include "voxel_grid.hpp"

/**
 * @brief Radius search over a VoxelGrid
 *
 * Only the voxels whose cells can intersect the query sphere are
 * inspected, so the cost depends on the radius and not on the size of
 * the obstacle field away from the vehicle. Each candidate is then
 * checked against the exact Euclidean distance.
 */
class NeighborhoodQuery
{
public:
  /**
   * @brief Collect grid points within a radius of a position
   *
   * @param grid   Static obstacle grid
   * @param center Query position (vehicle position)
   * @param radius Inclusive search radius, >= 0
   * @return Every grid point p with |p - center| <= radius
   */
  static std::vector<Eigen::Vector3d> query(const VoxelGrid& grid,
                                            const Eigen::Vector3d& center,
                                            double radius)
  {
    checkRadius(radius);

    std::vector<Eigen::Vector3d> result;
    if (grid.empty() || !center.allFinite()) return result;

    const Eigen::Vector3d lo_w = (center.array() - radius).matrix();
    const Eigen::Vector3d hi_w = (center.array() + radius).matrix();

    // Box reaches past the int index range: no cell scan possible
    if (!grid.indexable(lo_w) || !grid.indexable(hi_w)) {
      return queryLinear(grid, center, radius);
    }

    // Voxel index range touched by the bounding box of the sphere
    const VoxelIndex lo = grid.worldToVoxel(lo_w);
    const VoxelIndex hi = grid.worldToVoxel(hi_w);

    const double cells =
      (static_cast<double>(hi.x) - lo.x + 1.0) *
      (static_cast<double>(hi.y) - lo.y + 1.0) *
      (static_cast<double>(hi.z) - lo.z + 1.0);

    // Range larger than the grid itself: a linear scan is cheaper
    if (cells > static_cast<double>(grid.size())) {
      return queryLinear(grid, center, radius);
    }

    const double r2 = radius * radius;

    for (int x = lo.x; x <= hi.x; x++)
      for (int y = lo.y; y <= hi.y; y++)
        for (int z = lo.z; z <= hi.z; z++)
        {
          const Eigen::Vector3d* p = grid.pointAt({x, y, z});
          if (!p) continue;

          if ((*p - center).squaredNorm() <= r2) {
            result.push_back(*p);
          }
        }

    return result;
  }

  /**
   * @brief Linear scan over every grid point
   *
   * Same contract as query(). Used for small grids and as a reference
   * in tests.
   */
  static std::vector<Eigen::Vector3d> queryLinear(const VoxelGrid& grid,
                                                  const Eigen::Vector3d& center,
                                                  double radius)
  {
    checkRadius(radius);

    std::vector<Eigen::Vector3d> result;
    if (!center.allFinite()) return result;

    const double r2 = radius * radius;
    for (const auto& p : grid.points()) {
      if ((p - center).squaredNorm() <= r2) result.push_back(p);
    }
    return result;
  }

private:
  static void checkRadius(double radius)
  {
    if (!(radius >= 0.0) || !std::isfinite(radius)) {
      throw InvalidConfiguration(
        "query radius must be finite and non-negative, got " +
        std::to_string(radius));
    }
  }
};
