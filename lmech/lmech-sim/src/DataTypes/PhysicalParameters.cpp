// Ticket: 0001_double_pendulum_lagrangian

#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"

#include <cmath>
#include <string>

#include <fmt/format.h>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

namespace
{

void requireNonNegative(const char* name, double value)
{
  if (!std::isfinite(value) || value < 0.0)
  {
    throw InvalidParametersError(fmt::format(
      "Physical parameter {} must be finite and non-negative, got {}",
      name,
      value));
  }
}

}  // namespace

void PhysicalParameters::validate() const
{
  requireNonNegative("m1", m1);
  requireNonNegative("m2", m2);
  requireNonNegative("l1", l1);
  requireNonNegative("l2", l2);
  requireNonNegative("g", g);
}

}  // namespace lmech_sim
