// Ticket: 0001_double_pendulum_lagrangian
// Modified: 0003_double_double_pendulum (runDoubleDouble)

#include "lmech-sim/src/Simulation/Simulation.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lmech-sim/src/Physics/Integration/Evolver.hpp"
#include "lmech-sim/src/Physics/Lagrangian/DoublePendulumLagrangian.hpp"
#include "lmech-sim/src/Physics/Lagrangian/EulerLagrange.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

namespace
{

void requireCoordinates(const std::vector<double>& coords)
{
  if (coords.size() != kDoublePendulumDimension)
  {
    throw InvalidParametersError(
      fmt::format("Expected {} initial coordinates, got {}",
                  kDoublePendulumDimension,
                  coords.size()));
  }
}

State restingState(std::vector<double> q)
{
  State state;
  state.t = 0.0;
  state.qdot.assign(q.size(), 0.0);
  state.q = std::move(q);
  return state;
}

template <typename Lagrangian>
Trajectory integrate(Lagrangian lagrangian,
                     const State& initial,
                     double stepSize,
                     double horizon,
                     const RunOptions& options)
{
  const LagrangianStateDerivative<Lagrangian> derivative{
    std::move(lagrangian)};

  // Stream construction rejects bad sampling parameters before the
  // derivative is evaluated
  EvolveOptions evolveOptions;
  evolveOptions.compile = options.compile;
  evolveOptions.epsilon = options.epsilon;
  evolveOptions.minStepSize = options.minStepSize;

  SampleStream stream =
    evolve(derivative).samples(initial, stepSize, horizon, evolveOptions);
  derivative.validate(initial);

  Trajectory trajectory = stream.drain();
  spdlog::debug("Simulated {} samples to t = {} ({} substeps, {} rejected)",
                trajectory.size(),
                trajectory.back().t,
                stream.acceptedSteps(),
                stream.rejectedSteps());
  return trajectory;
}

}  // namespace

Trajectory run(double stepSize,
               double horizon,
               double l1,
               double l2,
               double m1,
               double m2,
               double g,
               const std::vector<double>& initialCoords,
               const RunOptions& options)
{
  const PhysicalParameters params{.m1 = m1, .m2 = m2, .l1 = l1, .l2 = l2, .g = g};
  requireCoordinates(initialCoords);

  return integrate(buildLagrangian(params),
                   restingState(initialCoords),
                   stepSize,
                   horizon,
                   options);
}

Trajectory run(double stepSize,
               double horizon,
               const std::vector<double>& initialCoords,
               const RunOptions& options)
{
  const PhysicalParameters defaults{};
  return run(stepSize,
             horizon,
             defaults.l1,
             defaults.l2,
             defaults.m1,
             defaults.m2,
             defaults.g,
             initialCoords,
             options);
}

Trajectory runDoubleDouble(double stepSize,
                           double horizon,
                           const std::vector<double>& initialQ1,
                           const PhysicalParameters& params,
                           double perturbation,
                           const RunOptions& options)
{
  requireCoordinates(initialQ1);

  std::vector<double> q = initialQ1;
  q.push_back(initialQ1[0]);
  q.push_back(initialQ1[1] + perturbation);

  return integrate(buildDoubleDoubleLagrangian(params),
                   restingState(std::move(q)),
                   stepSize,
                   horizon,
                   options);
}

std::vector<double> divergenceSeries(const Trajectory& compositeTrajectory,
                                     const DivergenceMonitor::Config& config)
{
  return DivergenceMonitor{config}.compute(compositeTrajectory);
}

}  // namespace lmech_sim
