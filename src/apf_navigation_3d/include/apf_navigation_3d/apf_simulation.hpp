#pragma once
#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>
#include <rclcpp/rclcpp.hpp>
#include "apf_errors.hpp"
#include "flight_controller.hpp"
#include "injection_policy.hpp"
#include "neighborhood_query.hpp"
#include "repulsive_force.hpp"
#include "vehicle_dynamics.hpp"
#include "vehicle_types.hpp"
#include "voxel_grid.hpp"
#include "waypoint_tracker.hpp"

/**
 * @brief Configuration of one APF simulation run
 *
 * Passed to ApfSimulation at construction and never changed afterwards.
 */
struct ApfConfig
{
  // Edge length of the obstacle voxels [m]
  double voxel_size = 0.25;

  // Radius of the repulsive field [m]. Also the neighborhood query
  // radius: points further away contribute exactly zero, so querying
  // wider would only add work.
  double influence_radius = 3.0;

  double repulsive_gain = 1.0;

  SaturationLimits limits;

  InjectionPolicy policy = InjectionPolicy::Velocity;

  // Fixed simulation step [s]
  double time_step = 0.005;

  /// @throws InvalidConfiguration describing the first bad field
  void validate() const
  {
    if (!(voxel_size > 0.0) || !std::isfinite(voxel_size)) {
      throw InvalidConfiguration("voxel_size must be > 0");
    }
    if (!(influence_radius > 0.0) || !std::isfinite(influence_radius)) {
      throw InvalidConfiguration("influence_radius must be > 0");
    }
    if (!(repulsive_gain >= 0.0) || !std::isfinite(repulsive_gain)) {
      throw InvalidConfiguration("repulsive_gain must be >= 0");
    }
    if (!(time_step > 0.0) || !std::isfinite(time_step)) {
      throw InvalidConfiguration("time_step must be > 0");
    }
    if (!(limits.max_velocity > 0.0)) {
      throw InvalidConfiguration("max_velocity must be > 0");
    }
    if (!(limits.min_thrust >= 0.0) || !(limits.max_thrust > limits.min_thrust)) {
      throw InvalidConfiguration("thrust limits must satisfy 0 <= min_thrust < max_thrust");
    }
    if (!(limits.max_tilt_deg > 0.0) || !(limits.max_tilt_deg < 90.0)) {
      throw InvalidConfiguration("max_tilt_deg must be in (0, 90)");
    }
  }
};

/**
 * @brief Step-local output, handed to the caller and then discarded
 */
struct StepTelemetry
{
  std::size_t step = 0;
  VehicleState state;

  Eigen::Vector3d position_setpoint = Eigen::Vector3d::Zero();
  Eigen::Vector3d velocity_setpoint = Eigen::Vector3d::Zero();
  Eigen::Vector3d repulsive_force = Eigen::Vector3d::Zero();
  Eigen::Vector3d thrust_command = Eigen::Vector3d::Zero();

  std::vector<Eigen::Vector3d> active_points;
};

struct RunSummary
{
  std::size_t steps = 0;
  double sim_time = 0.0;
  bool goal_reached = false;
};

/**
 * @brief Fixed-timestep APF simulation loop
 *
 * One step():
 *  1. dynamics advance with the previous command
 *  2. waypoint tracking and position loop -> velocity setpoint
 *  3. neighborhood query and repulsive force
 *  4. velocity-stage injection, velocity loop, force-stage injection
 *  5. the final thrust is kept for the next step
 *
 * A non-finite state or command throws SimulationDivergence. The run
 * cannot be resumed after that: every later step() rethrows the same
 * divergence without touching the state again.
 */
class ApfSimulation
{
public:
  ApfSimulation(const ApfConfig& config,
                std::shared_ptr<const VoxelGrid> grid,
                std::unique_ptr<VehicleDynamics> dynamics,
                std::unique_ptr<FlightController> controller,
                WaypointTracker waypoints = WaypointTracker())
  : config_(config),
    grid_(std::move(grid)),
    dynamics_(std::move(dynamics)),
    controller_(std::move(controller)),
    waypoints_(std::move(waypoints)),
    logger_(rclcpp::get_logger("apf_simulation"))
  {
    config_.validate();

    if (!grid_) throw InvalidConfiguration("voxel grid is null");
    if (!dynamics_) throw InvalidConfiguration("dynamics collaborator is null");
    if (!controller_) throw InvalidConfiguration("flight controller is null");

    hold_position_ = dynamics_->state().position;
    command_ = dynamics_->hoverThrust();

    RCLCPP_INFO(logger_,
      "APF simulation ready: %zu obstacle voxels, policy %s, "
      "influence radius %.2f m, gain %.2f, dt %.4f s",
      grid_->size(), toString(config_.policy),
      config_.influence_radius, config_.repulsive_gain, config_.time_step);
  }

  /**
   * @brief Run one control cycle
   *
   * @throws SimulationDivergence if the state or the command is not finite
   */
  StepTelemetry step()
  {
    if (diverged_at_ != 0) {
      throw SimulationDivergence(diverged_at_, "run already diverged");
    }

    const double dt = config_.time_step;
    ++step_;

    /* ---------- Dynamics (previous command) ---------- */
    dynamics_->update(command_, dt);
    const VehicleState& state = dynamics_->state();

    if (!state.isFinite()) {
      RCLCPP_ERROR(logger_, "Vehicle state diverged at step %zu", step_);
      diverged_at_ = step_;
      throw SimulationDivergence(step_, "vehicle state is not finite");
    }

    /* ---------- Navigation goal ---------- */
    if (waypoints_.update(state.position)) {
      RCLCPP_INFO(logger_, "Waypoint %zu/%zu reached at t=%.2f s",
        waypoints_.index(), waypoints_.size(), state.time);
    }

    StepTelemetry out;
    out.step = step_;
    out.position_setpoint = waypoints_.current(hold_position_);

    const Eigen::Vector3d vel_base =
      controller_->velocitySetpoint(state, out.position_setpoint);

    /* ---------- APF ---------- */
    out.active_points = NeighborhoodQuery::query(
      *grid_, state.position, config_.influence_radius);

    out.repulsive_force = RepulsiveForceModel::compute(
      out.active_points, state.position,
      config_.repulsive_gain, config_.influence_radius);

    /* ---------- Injection ---------- */
    out.velocity_setpoint = applyPolicy(
      config_.policy, {CommandStage::Velocity, vel_base},
      out.repulsive_force, config_.limits);

    // F-pre saturates thrust + force, the integrator must know
    const Eigen::Vector3d presat_offset =
      config_.policy == InjectionPolicy::ForcePreSaturation
        ? out.repulsive_force : Eigen::Vector3d(Eigen::Vector3d::Zero());

    const Eigen::Vector3d thrust_raw = controller_->thrustSetpoint(
      state, out.velocity_setpoint, dt, presat_offset);

    out.thrust_command = applyPolicy(
      config_.policy, {CommandStage::Force, thrust_raw},
      out.repulsive_force, config_.limits);

    if (!out.thrust_command.allFinite() || !out.velocity_setpoint.allFinite()) {
      RCLCPP_ERROR(logger_, "Command diverged at step %zu", step_);
      diverged_at_ = step_;
      throw SimulationDivergence(step_, "command is not finite");
    }

    command_ = out.thrust_command;
    out.state = state;
    return out;
  }

  /**
   * @brief Step until the last waypoint is reached or max_steps ran
   *
   * @param on_step Called with the telemetry of every step
   */
  RunSummary run(std::size_t max_steps,
                 const std::function<void(const StepTelemetry&)>& on_step = {})
  {
    RunSummary summary;

    while (summary.steps < max_steps && !finished())
    {
      StepTelemetry t = step();
      summary.steps++;
      if (on_step) on_step(t);
    }

    summary.sim_time = dynamics_->state().time;
    summary.goal_reached = finished();
    return summary;
  }

  /// True once the last waypoint has been reached
  bool finished() const { return waypoints_.complete(); }

  std::size_t stepIndex() const { return step_; }

  /// True once a step has thrown SimulationDivergence
  bool diverged() const { return diverged_at_ != 0; }

  const VehicleState& state() const { return dynamics_->state(); }

  const VoxelGrid& grid() const { return *grid_; }

  const ApfConfig& config() const { return config_; }

  const Eigen::Vector3d& command() const { return command_; }

  /// Replace the remaining waypoints, e.g. with a new goal
  void setPath(std::vector<Eigen::Vector3d> waypoints)
  {
    waypoints_.setPath(std::move(waypoints));
  }

  const WaypointTracker& waypoints() const { return waypoints_; }

private:
  ApfConfig config_;
  std::shared_ptr<const VoxelGrid> grid_;
  std::unique_ptr<VehicleDynamics> dynamics_;
  std::unique_ptr<FlightController> controller_;
  WaypointTracker waypoints_;

  rclcpp::Logger logger_;

  Eigen::Vector3d hold_position_ = Eigen::Vector3d::Zero();
  Eigen::Vector3d command_ = Eigen::Vector3d::Zero();
  std::size_t step_ = 0;

  // Step that diverged, 0 while the run is healthy
  std::size_t diverged_at_ = 0;
};
