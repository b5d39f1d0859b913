// Ticket: 0004_trajectory_diagnostics

#include "lmech-sim/src/Diagnostics/EnergyMonitor.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

EnergyMonitor::EnergyMonitor(EnergyFunction energy, const State& initialState)
  : energy_{std::move(energy)}
{
  if (!energy_)
  {
    throw InvalidParametersError("EnergyMonitor requires an energy function");
  }
  initialEnergy_ = energy_(initialState);
}

double EnergyMonitor::operator()(const State& state) const
{
  return energy_(state) - initialEnergy_;
}

double EnergyMonitor::initialEnergy() const
{
  return initialEnergy_;
}

bool EnergyMonitor::isWithinTolerance(double drift,
                                      double relativeTolerance,
                                      double absoluteTolerance) const
{
  double const tolerance =
    std::max(relativeTolerance * std::abs(initialEnergy_), absoluteTolerance);
  return std::abs(drift) <= tolerance;
}

}  // namespace lmech_sim
