// Ticket: 0001_double_pendulum_lagrangian
// Modified: 0003_double_double_pendulum (runDoubleDouble)

#ifndef LMECH_SIM_SIMULATION_SIMULATION_HPP
#define LMECH_SIM_SIMULATION_SIMULATION_HPP

#include <numbers>
#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"
#include "lmech-sim/src/Diagnostics/DivergenceMonitor.hpp"

namespace lmech_sim
{

inline constexpr double kDefaultStep = 0.01;      // [s]
inline constexpr double kDefaultHorizon = 50.0;   // [s]
inline constexpr double kDefaultEpsilon = 1e-13;
inline constexpr double kDefaultPerturbation = 1e-10;  // [rad]

// First link horizontal, second folded back along it: chaotic motion
inline const std::vector<double> kChaoticInitialQ{std::numbers::pi / 2.0,
                                                  std::numbers::pi};

// First link horizontal, second aligned with it: regular motion
inline const std::vector<double> kRegularInitialQ{std::numbers::pi / 2.0,
                                                  0.0};

/**
 * @brief Integration settings of a simulation run
 */
struct RunOptions
{
  double epsilon{kDefaultEpsilon};  ///< Absolute and relative error tolerance
  bool compile{true};               ///< Validate the derivative before sampling
  double minStepSize{1e-12};        ///< Smallest admissible substep [s]
};

/**
 * @brief Simulate a double pendulum released from rest
 *
 * The initial state is (0, initialCoords, (0, 0)). Samples are taken every
 * stepSize seconds up to the horizon, the first one being the initial state.
 *
 * @param stepSize Output interval [s], > 0
 * @param horizon Final time [s], > 0
 * @param l1 Length of the first link [m]
 * @param l2 Length of the second link [m]
 * @param m1 Mass of the first bob [kg]
 * @param m2 Mass of the second bob [kg]
 * @param g Gravitational acceleration [m/s²]
 * @param initialCoords Initial angles (θ1, θ2) [rad]
 * @param options Integration settings
 * @return floor(horizon / stepSize) + 1 sampled states
 * @throws InvalidParametersError before any computation on bad input
 * @throws DegenerateSystemError if the mass matrix is singular (e.g. m2 = 0)
 * @throws NumericalInstabilityError if integration breaks down
 * @ticket 0001_double_pendulum_lagrangian
 */
Trajectory run(double stepSize,
               double horizon,
               double l1,
               double l2,
               double m1,
               double m2,
               double g,
               const std::vector<double>& initialCoords,
               const RunOptions& options = {});

/**
 * @brief Simulate with the default physical constants
 *
 * m1 = 1.0 kg, m2 = 3.0 kg, l1 = 1.0 m, l2 = 0.9 m, g = 9.8 m/s²
 */
Trajectory run(double stepSize,
               double horizon,
               const std::vector<double>& initialCoords,
               const RunOptions& options = {});

/**
 * @brief Simulate two uncoupled double pendulums, the second kicked by
 * perturbation on its second angle
 *
 * The trajectory states have q = (θ1a, θ2a, θ1b, θ2b) with
 * (θ1b, θ2b) = (θ1a, θ2a + perturbation), both released from rest.
 *
 * @ticket 0003_double_double_pendulum
 */
Trajectory runDoubleDouble(double stepSize,
                           double horizon,
                           const std::vector<double>& initialQ1,
                           const PhysicalParameters& params = {},
                           double perturbation = kDefaultPerturbation,
                           const RunOptions& options = {});

/**
 * @brief Divergence series of a runDoubleDouble() trajectory
 */
std::vector<double> divergenceSeries(
  const Trajectory& compositeTrajectory,
  const DivergenceMonitor::Config& config = {});

}  // namespace lmech_sim

#endif  // LMECH_SIM_SIMULATION_SIMULATION_HPP
