#pragma once
#include <algorithm>
#include <cmath>
#include <Eigen/Dense>
#include "injection_policy.hpp"
#include "vehicle_types.hpp"

/**
 * @brief Flight-control collaborator seen by the APF pipeline
 *
 * The pipeline needs the two intermediate commands it can perturb:
 * the saturated velocity setpoint and the raw (unsaturated) thrust.
 */
class FlightController
{
public:
  virtual ~FlightController() = default;

  /// Position loop: desired velocity, saturated to the velocity limit
  virtual Eigen::Vector3d velocitySetpoint(const VehicleState& state,
                                           const Eigen::Vector3d& position_sp) = 0;

  /**
   * @brief Velocity loop: desired thrust [N] before envelope saturation
   *
   * @param presat_offset Vector added to the returned thrust downstream
   *                      before it is saturated. Anti-windup has to see
   *                      the thrust that is actually saturated.
   * @return Controller thrust, without presat_offset
   */
  virtual Eigen::Vector3d thrustSetpoint(const VehicleState& state,
                                         const Eigen::Vector3d& velocity_sp,
                                         double dt,
                                         const Eigen::Vector3d& presat_offset =
                                           Eigen::Vector3d::Zero()) = 0;

  /// Clear integrator state
  virtual void reset() = 0;
};

struct ControllerGains
{
  Eigen::Vector3d pos_p{2.0, 2.0, 1.0};
  Eigen::Vector3d vel_p{5.0, 5.0, 4.0};
  Eigen::Vector3d vel_i{5.0, 5.0, 5.0};
  Eigen::Vector3d vel_d{0.5, 0.5, 0.5};
};

/**
 * @brief Cascaded P position / PID velocity controller (ENU)
 *
 * Position error -> velocity setpoint (P), norm-saturated.
 * Velocity error -> thrust (PID + hover feed-forward m*g).
 *
 * Anti-windup:
 *  - vertical: integration stops while the thrust is saturated and the
 *    error pushes further into the limit
 *  - horizontal: tracking anti-reset-windup, the saturation excess is
 *    fed back into the error with gain 2/P
 */
class CascadedPositionController : public FlightController
{
public:
  CascadedPositionController(const VehicleParams& params,
                             const SaturationLimits& limits,
                             const ControllerGains& gains = ControllerGains())
  : params_(params), limits_(limits), gains_(gains) {}

  Eigen::Vector3d velocitySetpoint(const VehicleState& state,
                                   const Eigen::Vector3d& position_sp) override
  {
    const Eigen::Vector3d vel_sp =
      gains_.pos_p.cwiseProduct(position_sp - state.position);
    return saturateVector(vel_sp, limits_.max_velocity);
  }

  Eigen::Vector3d thrustSetpoint(const VehicleState& state,
                                 const Eigen::Vector3d& velocity_sp,
                                 double dt,
                                 const Eigen::Vector3d& presat_offset =
                                   Eigen::Vector3d::Zero()) override
  {
    Eigen::Vector3d vel_error = velocity_sp - state.velocity;

    Eigen::Vector3d thrust =
      gains_.vel_p.cwiseProduct(vel_error)
      - gains_.vel_d.cwiseProduct(state.acceleration)
      + thr_int_;

    // Hover feed-forward
    thrust.z() += params_.hoverThrust();

    // What the envelope will actually clip
    const Eigen::Vector3d commanded = thrust + presat_offset;
    const Eigen::Vector3d saturated = saturateThrust(commanded, limits_);

    // Vertical anti-windup
    const bool stop_int_z =
      (commanded.z() >= limits_.max_thrust && vel_error.z() >= 0.0) ||
      (commanded.z() <= limits_.min_thrust && vel_error.z() <= 0.0);

    if (!stop_int_z) {
      thr_int_.z() += gains_.vel_i.z() * vel_error.z() * dt;
      thr_int_.z() = std::min(std::abs(thr_int_.z()), limits_.max_thrust) *
                     (thr_int_.z() < 0.0 ? -1.0 : 1.0);
    }

    // Horizontal tracking anti-reset-windup
    const Eigen::Vector2d arw_gain =
      Eigen::Vector2d(2.0, 2.0).cwiseQuotient(gains_.vel_p.head<2>());
    const Eigen::Vector2d vel_err_lim =
      vel_error.head<2>() -
      (commanded.head<2>() - saturated.head<2>()).cwiseProduct(arw_gain);
    thr_int_.head<2>() += gains_.vel_i.head<2>().cwiseProduct(vel_err_lim) * dt;

    return thrust;
  }

  void reset() override { thr_int_.setZero(); }

  const Eigen::Vector3d& integral() const { return thr_int_; }

private:
  VehicleParams params_;
  SaturationLimits limits_;
  ControllerGains gains_;

  Eigen::Vector3d thr_int_ = Eigen::Vector3d::Zero();
};
