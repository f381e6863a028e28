#pragma once
#include <cstddef>
#include <utility>
#include <vector>
#include <Eigen/Dense>

/**
 * @brief Follows a list of position waypoints one by one
 *
 * The current waypoint is the position setpoint until the vehicle is
 * within the arrival distance, then the next one becomes active. Once
 * the last waypoint is reached it stays the setpoint (hold position).
 */
class WaypointTracker
{
public:
  WaypointTracker() = default;

  WaypointTracker(std::vector<Eigen::Vector3d> waypoints,
                  double arrival_distance)
  : waypoints_(std::move(waypoints)),
    arrival_distance_(arrival_distance) {}

  /// Replace the remaining path, restarting from its first waypoint
  void setPath(std::vector<Eigen::Vector3d> waypoints)
  {
    waypoints_ = std::move(waypoints);
    index_ = 0;
  }

  bool empty() const { return waypoints_.empty(); }

  /// True once the last waypoint has been reached
  bool complete() const
  {
    return !waypoints_.empty() && index_ >= waypoints_.size();
  }

  std::size_t index() const { return index_; }

  std::size_t size() const { return waypoints_.size(); }

  double arrivalDistance() const { return arrival_distance_; }

  /**
   * @brief Active position setpoint
   *
   * @param hold Returned when there are no waypoints at all
   */
  Eigen::Vector3d current(const Eigen::Vector3d& hold) const
  {
    if (waypoints_.empty()) return hold;
    if (complete()) return waypoints_.back();
    return waypoints_[index_];
  }

  /**
   * @brief Advance past the current waypoint if it was reached
   *
   * @return true if a waypoint was reached on this call
   */
  bool update(const Eigen::Vector3d& position)
  {
    if (waypoints_.empty() || complete()) return false;

    if (waypointReached(waypoints_[index_], position)) {
      index_++;
      return true;
    }
    return false;
  }

private:
  bool waypointReached(const Eigen::Vector3d& wp,
                       const Eigen::Vector3d& position) const
  {
    return (position - wp).norm() < arrival_distance_;
  }

  std::vector<Eigen::Vector3d> waypoints_;
  double arrival_distance_ = 0.5;
  std::size_t index_ = 0;
};
