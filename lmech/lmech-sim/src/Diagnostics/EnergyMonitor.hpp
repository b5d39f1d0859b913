// Ticket: 0004_trajectory_diagnostics

#ifndef LMECH_SIM_DIAGNOSTICS_ENERGY_MONITOR_HPP
#define LMECH_SIM_DIAGNOSTICS_ENERGY_MONITOR_HPP

#include <functional>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"

namespace lmech_sim
{

/**
 * @brief Energy drift of a trajectory relative to its initial state
 *
 * Stores the energy of the initial state and reports, for every later
 * state, energy(state) - energy(initial). For a conservative system the
 * drift measures integrator fidelity; with epsilon = 1e-13 it stays many
 * orders of magnitude below the energy scale of the system.
 *
 * @ticket 0004_trajectory_diagnostics
 */
class EnergyMonitor
{
public:
  using EnergyFunction = std::function<double(const State&)>;

  /**
   * @param energy Total mechanical energy of a state [J]
   * @param initialState Reference state; its energy is evaluated once
   * @throws InvalidParametersError if energy is empty
   */
  EnergyMonitor(EnergyFunction energy, const State& initialState);

  /**
   * @brief Energy change since the initial state [J]
   */
  [[nodiscard]] double operator()(const State& state) const;

  [[nodiscard]] double initialEnergy() const;

  /**
   * @brief Check a drift against combined tolerances
   *
   * Uses the larger of relative and absolute tolerance:
   * - Relative: relativeTolerance * |initialEnergy|
   * - Absolute: absoluteTolerance
   *
   * Unlike a dissipation check, drift in either direction counts.
   *
   * @param drift Value returned by operator() [J]
   * @param relativeTolerance Relative tolerance (default 1e-6)
   * @param absoluteTolerance Absolute tolerance [J] (default 1e-6)
   * @return true if |drift| stays within tolerance
   */
  [[nodiscard]] bool isWithinTolerance(double drift,
                                       double relativeTolerance = 1e-6,
                                       double absoluteTolerance = 1e-6) const;

private:
  EnergyFunction energy_;
  double initialEnergy_{0.0};
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_DIAGNOSTICS_ENERGY_MONITOR_HPP
