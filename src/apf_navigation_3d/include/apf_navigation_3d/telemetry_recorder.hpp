#pragma once
#include <fstream>
#include <string>
#include <Eigen/Dense>
#include "apf_errors.hpp"
#include "apf_simulation.hpp"

/**
 * @brief Writes one CSV row per simulation step
 *
 * Columns: step, time, position, velocity, velocity setpoint,
 * repulsive force, thrust command (x/y/z each), active point count.
 */
class TelemetryRecorder
{
public:
  explicit TelemetryRecorder(const std::string& path)
  : out_(path)
  {
    if (!out_) {
      throw InvalidConfiguration("cannot open telemetry file '" + path + "'");
    }

    out_ << "step,t";
    header("pos");
    header("vel");
    header("vel_sp");
    header("f_rep");
    header("thrust");
    out_ << ",active_points\n";
  }

  void record(const StepTelemetry& t)
  {
    out_ << t.step << ',' << t.state.time;
    row(t.state.position);
    row(t.state.velocity);
    row(t.velocity_setpoint);
    row(t.repulsive_force);
    row(t.thrust_command);
    out_ << ',' << t.active_points.size() << '\n';
  }

  void flush() { out_.flush(); }

private:
  void header(const char* name)
  {
    out_ << ',' << name << "_x," << name << "_y," << name << "_z";
  }

  void row(const Eigen::Vector3d& v)
  {
    out_ << ',' << v.x() << ',' << v.y() << ',' << v.z();
  }

  std::ofstream out_;
};
