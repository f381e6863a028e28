#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>
#include <Eigen/Dense>
#include "apf_errors.hpp"

/**
 * @brief Discrete 3D voxel index
 */
struct VoxelIndex
{
  int x, y, z;

  /// Equality operator
  bool operator==(const VoxelIndex& o) const
  {
    return x == o.x && y == o.y && z == o.z;
  }
};

struct VoxelIndexHash
{
  std::size_t operator()(const VoxelIndex& i) const
  {
    // Large primes spread neighbouring cells over the buckets
    const std::uint64_t h =
      static_cast<std::uint64_t>(static_cast<std::int64_t>(i.x)) * 73856093ULL ^
      static_cast<std::uint64_t>(static_cast<std::int64_t>(i.y)) * 19349669ULL ^
      static_cast<std::uint64_t>(static_cast<std::int64_t>(i.z)) * 83492791ULL;
    return static_cast<std::size_t>(h);
  }
};

/**
 * @brief Sparse voxel grid of static obstacle points
 *
 * - Fixed voxel size, set at construction
 * - At most one representative point per occupied voxel
 * - Built once from a fine point cloud, read-only afterwards
 *
 * The representative of a voxel is its cell centre. It does not depend
 * on which fine points fell into the cell or in which order, and
 * voxelizing the grid's own points with the same size gives back the
 * identical grid.
 */
class VoxelGrid
{
public:
  /**
   * @brief Voxelize a fine point cloud
   *
   * @param cloud      Fine-resolution obstacle points
   * @param voxel_size Edge length of a voxel, strictly positive
   * @return Grid with one point per occupied voxel (empty for an empty cloud)
   * @throws InvalidConfiguration on a non-positive voxel size, a
   *         non-finite input point or one too far out to be indexed
   */
  static VoxelGrid build(const std::vector<Eigen::Vector3d>& cloud,
                         double voxel_size)
  {
    VoxelGrid grid(voxel_size);
    grid.cells_.reserve(cloud.size() / 4 + 1);

    for (std::size_t i = 0; i < cloud.size(); ++i)
    {
      const Eigen::Vector3d& p = cloud[i];
      if (!p.allFinite()) {
        throw InvalidConfiguration(
          "obstacle point " + std::to_string(i) + " is not finite");
      }
      if (!grid.indexable(p)) {
        throw InvalidConfiguration(
          "obstacle point " + std::to_string(i) +
          " is outside the indexable range for voxel size " +
          std::to_string(voxel_size));
      }

      const VoxelIndex idx = grid.worldToVoxel(p);
      if (grid.cells_.count(idx)) continue;

      grid.cells_.emplace(idx, grid.points_.size());
      grid.points_.push_back(grid.voxelCenter(idx));
    }

    return grid;
  }

  explicit VoxelGrid(double voxel_size)
  : voxel_size_(voxel_size)
  {
    if (!(voxel_size > 0.0) || !std::isfinite(voxel_size)) {
      throw InvalidConfiguration(
        "voxel size must be strictly positive, got " +
        std::to_string(voxel_size));
    }
  }

  double voxelSize() const { return voxel_size_; }

  std::size_t size() const { return points_.size(); }

  bool empty() const { return points_.empty(); }

  /// All representative points, in first-occupied order
  const std::vector<Eigen::Vector3d>& points() const { return points_; }

  /**
   * @brief True if p maps to a voxel index representable as int
   *
   * One index is kept free at each end so that index + 1 and the
   * inclusive range loops of a query cannot overflow.
   */
  inline bool indexable(const Eigen::Vector3d& p) const
  {
    constexpr double lo = static_cast<double>(std::numeric_limits<int>::min()) + 1.0;
    constexpr double hi = static_cast<double>(std::numeric_limits<int>::max()) - 1.0;

    const Eigen::Vector3d scaled = (p / voxel_size_).array().floor().matrix();
    return scaled.allFinite() &&
           (scaled.array() >= lo).all() &&
           (scaled.array() <= hi).all();
  }

  // Convert a world position to its voxel index. p must be indexable().
  inline VoxelIndex worldToVoxel(const Eigen::Vector3d& p) const
  {
    return {
      static_cast<int>(std::floor(p.x() / voxel_size_)),
      static_cast<int>(std::floor(p.y() / voxel_size_)),
      static_cast<int>(std::floor(p.z() / voxel_size_))
    };
  }

  // Convert a voxel index to the world coordinates of its centre
  inline Eigen::Vector3d voxelCenter(const VoxelIndex& i) const
  {
    return {
      (i.x + 0.5) * voxel_size_,
      (i.y + 0.5) * voxel_size_,
      (i.z + 0.5) * voxel_size_
    };
  }

  // Check if a voxel holds an obstacle point
  inline bool isOccupied(const VoxelIndex& i) const
  {
    return cells_.count(i) != 0;
  }

  /// Representative point of an occupied voxel, nullptr if free
  inline const Eigen::Vector3d* pointAt(const VoxelIndex& i) const
  {
    auto it = cells_.find(i);
    return it == cells_.end() ? nullptr : &points_[it->second];
  }

private:
  double voxel_size_;

  // Voxel index -> position in points_
  std::unordered_map<VoxelIndex, std::size_t, VoxelIndexHash> cells_;

  std::vector<Eigen::Vector3d> points_;
};
