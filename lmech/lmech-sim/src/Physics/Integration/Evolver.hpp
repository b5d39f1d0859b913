// Ticket: 0002_sample_stream_integrator

#ifndef LMECH_SIM_PHYSICS_EVOLVER_HPP
#define LMECH_SIM_PHYSICS_EVOLVER_HPP

#include <functional>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/Physics/Integration/SampleStream.hpp"
#include "lmech-sim/src/Physics/Integration/StateDerivative.hpp"

namespace lmech_sim
{

// Receives every output sample exactly once, in increasing time order
using Observer = std::function<void(double t, const State& state)>;

/**
 * @brief Options of one integration run
 */
struct EvolveOptions
{
  /// Evaluate the state derivative once at the initial state before the
  /// first sample is produced, so configuration errors (a degenerate mass
  /// matrix, non-finite rates) surface before any observation
  bool compile{true};
  double epsilon{1e-13};      ///< Absolute and relative error tolerance
  double minStepSize{1e-12};  ///< Smallest admissible substep [s]
  Observer observe;           ///< Called once per sample by operator()
};

/**
 * @brief Driver integrating a fixed state derivative from arbitrary initial
 * states.
 *
 * Holds the state derivative only; every call builds its own SampleStream,
 * so independent runs share no mutable state.
 *
 * @ticket 0002_sample_stream_integrator
 */
class Evolver
{
public:
  explicit Evolver(StateDerivativeFunction derivative);

  /**
   * @brief Integrate to the horizon, delivering each sample to
   * options.observe
   * @param initial Initial state (reported as the first sample)
   * @param stepSize Output interval [s]
   * @param horizon Final time [s]
   * @param options Tolerance, eager validation and observer
   * @throws InvalidParametersError if options.observe is empty or the
   *         sampling parameters are invalid
   * @throws DegenerateSystemError from the state derivative
   * @throws NumericalInstabilityError if integration breaks down; samples
   *         already observed remain valid
   */
  void operator()(const State& initial,
                  double stepSize,
                  double horizon,
                  const EvolveOptions& options) const;

  /**
   * @brief Lazily pulled samples of the same run
   *
   * options.observe is ignored; the caller pulls samples from the stream.
   */
  [[nodiscard]] SampleStream samples(const State& initial,
                                     double stepSize,
                                     double horizon,
                                     const EvolveOptions& options) const;

private:
  StateDerivativeFunction derivative_;
};

/**
 * @brief Build an Evolver for a state derivative
 */
Evolver evolve(StateDerivativeFunction derivative);

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_EVOLVER_HPP
