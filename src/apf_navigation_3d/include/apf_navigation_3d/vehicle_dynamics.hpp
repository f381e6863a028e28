#pragma once
#include <cmath>
#include <Eigen/Dense>
#include <Eigen/Geometry>
#include "vehicle_types.hpp"

/**
 * @brief Dynamics collaborator: owns and advances the vehicle state
 */
class VehicleDynamics
{
public:
  virtual ~VehicleDynamics() = default;

  /// Advance the state by dt under a world-frame thrust command [N]
  virtual void update(const Eigen::Vector3d& thrust, double dt) = 0;

  virtual const VehicleState& state() const = 0;

  /// Command that holds the vehicle in hover, used before the first step
  virtual Eigen::Vector3d hoverThrust() const = 0;
};

/**
 * @brief Translational point-mass model (ENU)
 *
 *   a = thrust / m - g * e_z - drag / m * v
 *
 * Integrated with semi-implicit Euler. The attitude follows the
 * commanded thrust direction at zero yaw, as if the attitude loop were
 * ideal; the angular rate is the attitude change over the step.
 */
class PointMassDynamics : public VehicleDynamics
{
public:
  PointMassDynamics(const VehicleParams& params,
                    const Eigen::Vector3d& initial_position,
                    const Eigen::Vector3d& initial_velocity = Eigen::Vector3d::Zero())
  : params_(params)
  {
    state_.position = initial_position;
    state_.velocity = initial_velocity;
  }

  void update(const Eigen::Vector3d& thrust, double dt) override
  {
    const Eigen::Vector3d acc =
      thrust / params_.mass
      - Eigen::Vector3d(0.0, 0.0, params_.gravity)
      - params_.drag / params_.mass * state_.velocity;

    state_.velocity += acc * dt;
    state_.position += state_.velocity * dt;
    state_.acceleration = acc;

    const Eigen::Quaterniond q_new = thrustToAttitude(thrust);
    state_.angular_rate = rateBetween(state_.attitude, q_new, dt);
    state_.attitude = q_new;

    state_.time += dt;
  }

  const VehicleState& state() const override { return state_; }

  Eigen::Vector3d hoverThrust() const override
  {
    return Eigen::Vector3d(0.0, 0.0, params_.hoverThrust());
  }

private:
  /* Body z along the thrust, body x in the x-z plane (yaw = 0) */
  static Eigen::Quaterniond thrustToAttitude(const Eigen::Vector3d& thrust)
  {
    if (thrust.squaredNorm() < 1e-12) {
      return Eigen::Quaterniond::Identity();
    }

    const Eigen::Vector3d body_z = thrust.normalized();
    const Eigen::Vector3d y_c(0.0, 1.0, 0.0);

    Eigen::Vector3d body_x = y_c.cross(body_z);
    if (body_x.squaredNorm() < 1e-12) {
      // Thrust along world y: pick x as world x
      body_x = Eigen::Vector3d::UnitX();
    }
    body_x.normalize();

    const Eigen::Vector3d body_y = body_z.cross(body_x);

    Eigen::Matrix3d R;
    R.col(0) = body_x;
    R.col(1) = body_y;
    R.col(2) = body_z;
    return Eigen::Quaterniond(R).normalized();
  }

  /* Body-frame angular rate taking q0 to q1 in dt */
  static Eigen::Vector3d rateBetween(const Eigen::Quaterniond& q0,
                                     const Eigen::Quaterniond& q1,
                                     double dt)
  {
    if (dt <= 0.0) return Eigen::Vector3d::Zero();

    Eigen::Quaterniond dq = q0.conjugate() * q1;
    if (dq.w() < 0.0) dq.coeffs() = -dq.coeffs();

    const Eigen::AngleAxisd aa(dq);
    return aa.axis() * aa.angle() / dt;
  }

  VehicleParams params_;
  VehicleState state_;
};
