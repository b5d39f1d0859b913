// Ticket: 0002_sample_stream_integrator

#include "lmech-sim/src/Physics/Integration/Evolver.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

Evolver::Evolver(StateDerivativeFunction derivative)
  : derivative_{std::move(derivative)}
{
}

void Evolver::operator()(const State& initial,
                         double stepSize,
                         double horizon,
                         const EvolveOptions& options) const
{
  if (!options.observe)
  {
    throw InvalidParametersError("Evolve requires an observer");
  }

  SampleStream stream = samples(initial, stepSize, horizon, options);
  while (auto sample = stream.next())
  {
    options.observe(sample->t, *sample);
  }
}

SampleStream Evolver::samples(const State& initial,
                              double stepSize,
                              double horizon,
                              const EvolveOptions& options) const
{
  SampleStream::Config config;
  config.stepSize = stepSize;
  config.horizon = horizon;
  config.epsilon = options.epsilon;
  config.minStepSize = options.minStepSize;

  SampleStream stream{derivative_, initial, config};

  if (options.compile)
  {
    const State rate = derivative_(initial);
    const auto finite = [](double v) { return std::isfinite(v); };
    if (!std::all_of(rate.q.begin(), rate.q.end(), finite) ||
        !std::all_of(rate.qdot.begin(), rate.qdot.end(), finite))
    {
      spdlog::warn("Evolver: non-finite state derivative at t = {}",
                   initial.t);
      throw NumericalInstabilityError(
        fmt::format("State derivative is not finite at t = {}", initial.t),
        initial.t);
    }
  }

  return stream;
}

Evolver evolve(StateDerivativeFunction derivative)
{
  return Evolver{std::move(derivative)};
}

}  // namespace lmech_sim
