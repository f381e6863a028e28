#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Setup-time error: bad voxel size, gain, radius, limits or policy
 *
 * Raised before the simulation loop starts. The run never begins.
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
  explicit InvalidConfiguration(const std::string &what)
  : std::invalid_argument(what) {}
};

/**
 * @brief Non-finite vehicle state or command detected mid-run
 *
 * Fatal to the run. step() is the index of the step that diverged.
 */
class SimulationDivergence : public std::runtime_error
{
public:
  SimulationDivergence(std::size_t step, const std::string &what)
  : std::runtime_error(
      "step " + std::to_string(step) + ": " + what),
    step_(step) {}

  std::size_t step() const { return step_; }

private:
  std::size_t step_;
};
