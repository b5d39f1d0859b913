// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_SIMULATION_ERRORS_HPP
#define LMECH_SIM_PHYSICS_SIMULATION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lmech_sim
{

/**
 * @brief Rejected input: non-positive step or horizon, non-finite physical
 * constants, or q/q̇ tuples of mismatched shape.
 *
 * Raised before any computation starts.
 */
class InvalidParametersError final : public std::invalid_argument
{
public:
  explicit InvalidParametersError(const std::string& message)
    : std::invalid_argument(message)
  {
  }
};

/**
 * @brief The effective mass matrix ∂²L/∂q̇∂q̇ is singular, so the
 * Euler-Lagrange system cannot be solved for q̈.
 */
class DegenerateSystemError final : public std::runtime_error
{
public:
  explicit DegenerateSystemError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief Adaptive integration could not meet its error tolerance without the
 * step size collapsing, or the state stopped being finite.
 *
 * Samples delivered before the failure remain valid.
 */
class NumericalInstabilityError final : public std::runtime_error
{
public:
  NumericalInstabilityError(const std::string& message, double time)
    : std::runtime_error(message), time_{time}
  {
  }

  // Simulation time at which integration failed [s]
  [[nodiscard]] double time() const
  {
    return time_;
  }

private:
  double time_;
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_SIMULATION_ERRORS_HPP
