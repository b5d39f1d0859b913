// Ticket: 0003_double_double_pendulum

#ifndef LMECH_SIM_DIAGNOSTICS_DIVERGENCE_MONITOR_HPP
#define LMECH_SIM_DIAGNOSTICS_DIVERGENCE_MONITOR_HPP

#include <cstddef>
#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"

namespace lmech_sim
{

/**
 * @brief Natural logarithm clamped to a finite floor
 * @return floor if x < threshold, log(x) otherwise
 */
double safeLog(double x, double threshold = 1e-60, double floor = -138.0);

/**
 * @brief Logarithmic separation of two nearly identical trajectories
 *
 * For each pair of samples, computes
 *
 *   safeLog(|principalValue(qA[c] - qB[c])|)
 *
 * for a designated coordinate c. Started from initial conditions that differ
 * by ~1e-10, the slope of the resulting series approximates the largest
 * Lyapunov exponent; identical trajectories stay at the floor.
 *
 * @ticket 0003_double_double_pendulum
 */
class DivergenceMonitor
{
public:
  struct Config
  {
    std::size_t coordinate{1};          ///< Compared coordinate within each sub-state
    std::size_t subsystemDimension{2};  ///< Coordinates per sub-state of a composite state
    double threshold{1e-60};            ///< Separations below this map to floor
    double floor{-138.0};               ///< Log value reported for vanishing separation
  };

  DivergenceMonitor() = default;
  explicit DivergenceMonitor(const Config& config);

  /**
   * @brief Divergence between the two sub-states of a composite state
   *
   * Compares q[coordinate] with q[subsystemDimension + coordinate].
   *
   * @throws InvalidParametersError if the state is too small
   */
  [[nodiscard]] double operator()(const State& compositeState) const;

  /**
   * @brief Divergence between two single-system states
   * @throws InvalidParametersError if either state lacks the coordinate
   */
  [[nodiscard]] double compare(const State& a, const State& b) const;

  /**
   * @brief Per-sample divergence of two trajectories
   * @throws InvalidParametersError if the trajectories differ in length
   */
  [[nodiscard]] std::vector<double> compute(const Trajectory& a,
                                            const Trajectory& b) const;

  /**
   * @brief Per-sample divergence of a composite trajectory
   */
  [[nodiscard]] std::vector<double> compute(
    const Trajectory& compositeTrajectory) const;

  [[nodiscard]] const Config& getConfig() const;

private:
  [[nodiscard]] double separation(double a, double b) const;

  Config config_;
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_DIAGNOSTICS_DIVERGENCE_MONITOR_HPP
