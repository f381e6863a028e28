#pragma once
#include <cmath>
#include <Eigen/Dense>
#include <Eigen/Geometry>

/**
 * @brief Vehicle state in the ENU world frame
 *
 * Owned and mutated only by the dynamics collaborator.
 * The APF pipeline reads it.
 */
struct VehicleState
{
  double time = 0.0;

  Eigen::Vector3d position = Eigen::Vector3d::Zero();
  Eigen::Vector3d velocity = Eigen::Vector3d::Zero();

  // Linear acceleration, used by the velocity loop D-term
  Eigen::Vector3d acceleration = Eigen::Vector3d::Zero();

  Eigen::Quaterniond attitude = Eigen::Quaterniond::Identity();
  Eigen::Vector3d angular_rate = Eigen::Vector3d::Zero();

  bool isFinite() const
  {
    return std::isfinite(time) &&
           position.allFinite() &&
           velocity.allFinite() &&
           acceleration.allFinite() &&
           attitude.coeffs().allFinite() &&
           angular_rate.allFinite();
  }
};

/**
 * @brief Physical parameters shared by dynamics and controller
 */
struct VehicleParams
{
  double mass = 1.2;        // [kg]
  double gravity = 9.81;    // [m/s^2]
  double drag = 0.0;        // linear drag coefficient [N s/m]

  double hoverThrust() const { return mass * gravity; }
};

/**
 * @brief Saturation envelope of the command pipeline
 *
 * - max_velocity bounds the desired velocity norm
 * - min_thrust / max_thrust bound the collective thrust
 * - max_tilt_deg bounds the thrust vector tilt from vertical
 */
struct SaturationLimits
{
  double max_velocity = 5.0;   // [m/s]
  double min_thrust = 1.0;     // [N]
  double max_thrust = 30.0;    // [N]
  double max_tilt_deg = 50.0;  // [deg]

  double maxTiltRad() const { return max_tilt_deg * M_PI / 180.0; }
};
