// Ticket: 0003_double_double_pendulum

#include "lmech-sim/src/Diagnostics/DivergenceMonitor.hpp"

#include <cmath>

#include <fmt/format.h>

#include "lmech-sim/src/Environment/Angle.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

double safeLog(double x, double threshold, double floor)
{
  if (x < threshold)
  {
    return floor;
  }
  return std::log(x);
}

DivergenceMonitor::DivergenceMonitor(const Config& config) : config_{config}
{
  if (config_.coordinate >= config_.subsystemDimension)
  {
    throw InvalidParametersError(
      fmt::format("Divergence coordinate {} outside a sub-state of {}",
                  config_.coordinate,
                  config_.subsystemDimension));
  }
}

double DivergenceMonitor::operator()(const State& compositeState) const
{
  const std::size_t second = config_.subsystemDimension + config_.coordinate;
  if (compositeState.q.size() <= second)
  {
    throw InvalidParametersError(fmt::format(
      "Composite state with {} coordinates has no second sub-state",
      compositeState.q.size()));
  }
  return separation(compositeState.q[config_.coordinate],
                    compositeState.q[second]);
}

double DivergenceMonitor::compare(const State& a, const State& b) const
{
  if (a.q.size() <= config_.coordinate || b.q.size() <= config_.coordinate)
  {
    throw InvalidParametersError(
      fmt::format("States lack coordinate {}", config_.coordinate));
  }
  return separation(a.q[config_.coordinate], b.q[config_.coordinate]);
}

std::vector<double> DivergenceMonitor::compute(const Trajectory& a,
                                               const Trajectory& b) const
{
  if (a.size() != b.size())
  {
    throw InvalidParametersError(
      fmt::format("Trajectories differ in length: {} vs {}", a.size(), b.size()));
  }

  std::vector<double> series;
  series.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i)
  {
    series.push_back(compare(a[i], b[i]));
  }
  return series;
}

std::vector<double> DivergenceMonitor::compute(
  const Trajectory& compositeTrajectory) const
{
  std::vector<double> series;
  series.reserve(compositeTrajectory.size());
  for (const auto& state : compositeTrajectory)
  {
    series.push_back((*this)(state));
  }
  return series;
}

const DivergenceMonitor::Config& DivergenceMonitor::getConfig() const
{
  return config_;
}

double DivergenceMonitor::separation(double a, double b) const
{
  return safeLog(std::abs(principalValue(a - b)),
                 config_.threshold,
                 config_.floor);
}

}  // namespace lmech_sim
