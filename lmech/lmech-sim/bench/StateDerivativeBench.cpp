// Ticket: 0002_sample_stream_integrator

#include <benchmark/benchmark.h>
#include <vector>
#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"
#include "lmech-sim/src/Physics/Lagrangian/DoublePendulumLagrangian.hpp"
#include "lmech-sim/src/Physics/Lagrangian/EulerLagrange.hpp"
#include "lmech-sim/src/Simulation/Simulation.hpp"

using namespace lmech_sim;

// ============================================================================
// State Derivative Benchmarks
// ============================================================================

/**
 * @brief Cost of one (1, q̇, q̈) evaluation for a double pendulum.
 *
 * Every call seeds the Lagrangian with autodiff jets along each coordinate
 * and velocity direction and solves the 2x2 mass matrix system.
 *
 * @ticket 0002_sample_stream_integrator
 */
static void BM_StateDerivative_DoublePendulum(benchmark::State& state)
{
  const LagrangianStateDerivative derivative{
    buildLagrangian(PhysicalParameters{})};
  const State s{.t = 0.0, .q = {0.7, -1.2}, .qdot = {0.3, 2.1}};

  for (auto _ : state)
  {
    State rate = derivative(s);
    benchmark::DoNotOptimize(rate);
  }
}
BENCHMARK(BM_StateDerivative_DoublePendulum);

/**
 * @brief Same evaluation for the four-coordinate double-double pendulum.
 *
 * The number of directional derivatives grows quadratically with the
 * coordinate count through the mass matrix.
 *
 * @ticket 0003_double_double_pendulum
 */
static void BM_StateDerivative_DoubleDoublePendulum(benchmark::State& state)
{
  const LagrangianStateDerivative derivative{
    buildDoubleDoubleLagrangian(PhysicalParameters{})};
  const State s{.t = 0.0,
                .q = {0.7, -1.2, 0.7, -1.2 + 1e-10},
                .qdot = {0.3, 2.1, 0.3, 2.1}};

  for (auto _ : state)
  {
    State rate = derivative(s);
    benchmark::DoNotOptimize(rate);
  }
}
BENCHMARK(BM_StateDerivative_DoubleDoublePendulum);

// ============================================================================
// Integration Benchmarks
// ============================================================================

// One simulated second of the chaotic preset, sampled every 10 ms
static void BM_Run_ChaoticOneSecond(benchmark::State& state)
{
  for (auto _ : state)
  {
    Trajectory trajectory = run(kDefaultStep, 1.0, kChaoticInitialQ);
    benchmark::DoNotOptimize(trajectory);
  }
}
BENCHMARK(BM_Run_ChaoticOneSecond)->Unit(benchmark::kMillisecond);

static void BM_Run_ChaoticOneSecond_LooseEpsilon(benchmark::State& state)
{
  RunOptions options;
  options.epsilon = 1e-8;
  for (auto _ : state)
  {
    Trajectory trajectory = run(kDefaultStep, 1.0, kChaoticInitialQ, options);
    benchmark::DoNotOptimize(trajectory);
  }
}
BENCHMARK(BM_Run_ChaoticOneSecond_LooseEpsilon)->Unit(benchmark::kMillisecond);
