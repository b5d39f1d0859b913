/**
 * @file double_pendulum.cpp
 * @brief Example running the chaotic and regular double pendulum presets
 *
 * Usage: lmech_double_pendulum [step] [horizon]
 */

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"
#include "lmech-sim/src/Simulation/PostProcessing.hpp"
#include "lmech-sim/src/Simulation/Simulation.hpp"

using namespace lmech_sim;

namespace
{

void report(const std::string& name, const Trajectory& trajectory)
{
  const std::vector<Record> records = transformData(trajectory);

  double worstDrift = 0.0;
  for (const auto& r : records)
  {
    worstDrift = std::max(worstDrift, std::abs(r.dEnergy));
  }

  const Record& last = records.back();
  spdlog::info("{}: {} samples, final t = {:.2f}", name, records.size(), last.t);
  spdlog::info("  theta1 = {:+.6f}  theta2 = {:+.6f}  "
               "thetadot1 = {:+.6f}  thetadot2 = {:+.6f}",
               last.theta1,
               last.theta2,
               last.thetadot1,
               last.thetadot2);
  spdlog::info("  max |d_energy| = {:.3e} J", worstDrift);
}

}  // namespace

int main(int argc, char** argv)
{
  spdlog::set_default_logger(spdlog::stdout_color_mt("lmech"));
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  double step = kDefaultStep;
  double horizon = kDefaultHorizon;
  try
  {
    if (argc > 1)
    {
      step = std::stod(argv[1]);
    }
    if (argc > 2)
    {
      horizon = std::stod(argv[2]);
    }
  }
  catch (const std::exception& e)
  {
    spdlog::error("Usage: {} [step] [horizon] ({})", argv[0], e.what());
    return EXIT_FAILURE;
  }

  try
  {
    report("Chaotic", run(step, horizon, kChaoticInitialQ));
    report("Regular", run(step, horizon, kRegularInitialQ));

    const Trajectory paired = runDoubleDouble(step, horizon, kChaoticInitialQ);
    const std::vector<double> divergence = divergenceSeries(paired);
    spdlog::info("Divergence after {:.2f} s: log|dtheta2| = {:.3f} (start {:.3f})",
                 paired.back().t,
                 divergence.back(),
                 divergence.front());
  }
  catch (const InvalidParametersError& e)
  {
    spdlog::error("Invalid parameters: {}", e.what());
    return EXIT_FAILURE;
  }
  catch (const NumericalInstabilityError& e)
  {
    spdlog::error("Integration failed at t = {}: {}", e.time(), e.what());
    return EXIT_FAILURE;
  }
  catch (const DegenerateSystemError& e)
  {
    spdlog::error("Degenerate system: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
