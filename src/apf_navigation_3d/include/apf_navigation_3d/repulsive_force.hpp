#pragma once
#include <algorithm>
#include <vector>
#include <Eigen/Dense>

/**
 * @brief Repulsive potential field of static obstacle points
 *
 * Each point p at distance d from the vehicle pushes it away along
 * (position - p) / d with magnitude
 *
 *     gain * (1/d - 1/R) * 1/d^2      for d < R
 *     0                               for d >= R
 *
 * which is the negative gradient of the classic potential
 * 0.5 * gain * (1/d - 1/R)^2. Contributions are summed without
 * normalization, so a dense cluster pushes harder than a single point.
 *
 * A point closer than kMinDistance is treated as lying at kMinDistance.
 * A point exactly on the vehicle has no direction of its own and pushes
 * straight up (+z) with that clamped magnitude.
 *
 * The model carries no attraction. The goal is pursued by the flight
 * controller, which this force only perturbs.
 */
class RepulsiveForceModel
{
public:
  /// Distances below this are clamped before dividing [m]
  static constexpr double kMinDistance = 1e-3;

  /**
   * @brief Sum of the repulsive contributions of all points
   *
   * @param points          Active obstacle points
   * @param position        Vehicle position
   * @param gain            Repulsive gain, >= 0
   * @param influence_radius Radius R beyond which points contribute nothing
   */
  static Eigen::Vector3d compute(const std::vector<Eigen::Vector3d>& points,
                                 const Eigen::Vector3d& position,
                                 double gain,
                                 double influence_radius)
  {
    Eigen::Vector3d force = Eigen::Vector3d::Zero();

    for (const auto& p : points)
    {
      const Eigen::Vector3d away = position - p;
      const double dist = away.norm();

      if (dist >= influence_radius) continue;

      const Eigen::Vector3d dir =
        dist > 0.0 ? Eigen::Vector3d(away / dist) : Eigen::Vector3d(Eigen::Vector3d::UnitZ());

      force += magnitude(dist, gain, influence_radius) * dir;
    }

    return force;
  }

  /**
   * @brief Force magnitude of one point at a given distance
   *
   * The distance is clamped to kMinDistance so a point touching the
   * vehicle yields a large but finite push.
   */
  static double magnitude(double dist, double gain, double influence_radius)
  {
    if (dist >= influence_radius) return 0.0;

    const double d = std::max(dist, kMinDistance);
    if (d >= influence_radius) return 0.0;

    return gain * (1.0 / d - 1.0 / influence_radius) / (d * d);
  }
};
