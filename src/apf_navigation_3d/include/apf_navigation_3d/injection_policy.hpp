#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <Eigen/Dense>
#include "apf_errors.hpp"
#include "vehicle_types.hpp"

/* ============================================================
 * Saturation
 * ============================================================
 */

/**
 * @brief Clamp the norm of a vector, keeping its direction
 */
inline Eigen::Vector3d saturateVector(const Eigen::Vector3d& v, double limit)
{
  const double n = v.norm();
  if (n > limit && n > 0.0) {
    return v / n * limit;
  }
  return v;
}

/**
 * @brief Project a thrust vector into the tilt/thrust envelope
 *
 * Vertical priority: the up component is clamped to
 * [min_thrust, max_thrust] first, then the horizontal component is
 * rescaled (heading kept) to whatever the tilt limit and the remaining
 * thrust allow. The result norm never exceeds max_thrust.
 */
inline Eigen::Vector3d saturateThrust(const Eigen::Vector3d& thrust,
                                      const SaturationLimits& limits)
{
  Eigen::Vector3d out = thrust;
  out.z() = std::min(std::max(thrust.z(), limits.min_thrust), limits.max_thrust);

  // Max allowed horizontal thrust based on tilt and excess thrust
  const double xy_max_tilt = std::abs(out.z()) * std::tan(limits.maxTiltRad());
  const double excess = limits.max_thrust * limits.max_thrust - out.z() * out.z();
  const double xy_max = std::min(xy_max_tilt, std::sqrt(std::max(excess, 0.0)));

  const Eigen::Vector2d xy = thrust.head<2>();
  if (xy.squaredNorm() > xy_max * xy_max) {
    out.head<2>() = xy / xy.norm() * xy_max;
  }
  return out;
}

/* ============================================================
 * Injection policy
 * ============================================================
 */

/**
 * @brief Pipeline stage that receives the repulsive vector
 *
 * Selected once per run.
 *
 *  - Velocity:            added to the saturated velocity setpoint,
 *                         re-saturated against max_velocity
 *  - ForcePreSaturation:  added to the raw thrust, then the sum is
 *                         saturated once
 *  - ForcePostSaturation: added after thrust saturation, not
 *                         re-saturated; may leave the envelope
 */
enum class InjectionPolicy
{
  Velocity,
  ForcePreSaturation,
  ForcePostSaturation
};

/// Intermediate command the controller hands to the policy
enum class CommandStage
{
  Velocity,  // saturated desired velocity [m/s]
  Force      // raw desired thrust, not yet saturated [N]
};

struct BaseCommand
{
  CommandStage stage;
  Eigen::Vector3d value;
};

inline InjectionPolicy parseInjectionPolicy(const std::string& name)
{
  if (name == "V" || name == "velocity") {
    return InjectionPolicy::Velocity;
  }
  if (name == "F-pre" || name == "force_pre") {
    return InjectionPolicy::ForcePreSaturation;
  }
  if (name == "F-post" || name == "force_post") {
    return InjectionPolicy::ForcePostSaturation;
  }
  throw InvalidConfiguration(
    "unknown injection policy '" + name +
    "' (expected V, F-pre or F-post)");
}

inline const char* toString(InjectionPolicy policy)
{
  switch (policy) {
    case InjectionPolicy::Velocity:            return "V";
    case InjectionPolicy::ForcePreSaturation:  return "F-pre";
    case InjectionPolicy::ForcePostSaturation: return "F-post";
  }
  return "?";
}

/**
 * @brief Merge the repulsive vector into one stage of the command
 *
 * Pure function. A stage the policy does not target passes through,
 * except the force stage which is always saturated so every policy
 * hands the vehicle an enveloped thrust (F-post then adds on top).
 *
 * @param policy    Active injection policy
 * @param base      Controller command at the given stage
 * @param repulsive Repulsive vector of this step
 * @param limits    Saturation envelope
 * @return Command to continue the pipeline with
 */
inline Eigen::Vector3d applyPolicy(InjectionPolicy policy,
                                   const BaseCommand& base,
                                   const Eigen::Vector3d& repulsive,
                                   const SaturationLimits& limits)
{
  switch (base.stage)
  {
    case CommandStage::Velocity:
      if (policy == InjectionPolicy::Velocity) {
        return saturateVector(base.value + repulsive, limits.max_velocity);
      }
      return base.value;

    case CommandStage::Force:
      switch (policy) {
        case InjectionPolicy::ForcePreSaturation:
          return saturateThrust(base.value + repulsive, limits);
        case InjectionPolicy::ForcePostSaturation:
          return saturateThrust(base.value, limits) + repulsive;
        case InjectionPolicy::Velocity:
          return saturateThrust(base.value, limits);
      }
      break;
  }
  return base.value;
}
