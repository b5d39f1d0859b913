// Ticket: 0002_sample_stream_integrator

#ifndef LMECH_SIM_PHYSICS_SAMPLE_STREAM_HPP
#define LMECH_SIM_PHYSICS_SAMPLE_STREAM_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/numeric/odeint.hpp>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/Physics/Integration/StateDerivative.hpp"

namespace lmech_sim
{

/**
 * @brief Lazily integrated, fixed-interval samples of a trajectory.
 *
 * Integrates dState/dt = derivative(State) with an adaptive embedded
 * Runge-Kutta-Fehlberg 7(8) scheme (Boost.Odeint controlled stepper).
 * Substeps adapt to meet the error tolerance and are truncated so that the
 * integrator lands exactly on every output time t0 + k·stepSize, for
 * k = 0 … floor((horizon - t0) / stepSize).
 *
 * The sequence is finite, forward-only, non-restartable and meant for a
 * single consumer. Each sample is produced exactly once, in strictly
 * increasing time order; the first sample is the initial state itself.
 * Integration work happens only when the next sample is pulled.
 *
 * After a NumericalInstabilityError the stream is exhausted; samples
 * already pulled remain valid.
 *
 * @ticket 0002_sample_stream_integrator
 */
class SampleStream
{
public:
  struct Config
  {
    double stepSize{0.01};       ///< Output sample interval [s]
    double horizon{50.0};        ///< Time of the last possible sample [s]
    double epsilon{1e-13};       ///< Absolute and relative error tolerance
    double minStepSize{1e-12};   ///< Smallest admissible substep [s]
    int maxFailedSteps{500};     ///< Consecutive rejected substeps allowed
  };

  /**
   * @brief Prepare a stream; no integration happens until next()
   * @param derivative Right-hand side (t, q, q̇) -> (1, q̇, q̈)
   * @param initial Initial state, reported unchanged as the first sample
   * @param config Sampling and tolerance settings
   * @throws InvalidParametersError for non-positive or non-finite step,
   *         horizon or epsilon, a horizon before the initial time, an empty
   *         derivative, or mismatched q/q̇
   */
  SampleStream(StateDerivativeFunction derivative,
               State initial,
               const Config& config);

  ~SampleStream() = default;

  SampleStream(const SampleStream&) = delete;
  SampleStream& operator=(const SampleStream&) = delete;
  SampleStream(SampleStream&&) noexcept = default;
  SampleStream& operator=(SampleStream&&) noexcept = default;

  /**
   * @brief Integrate up to the next output time and return its state
   * @return The next sample, or std::nullopt once the stream is exhausted
   * @throws NumericalInstabilityError if the step size collapses or the
   *         state stops being finite
   */
  std::optional<State> next();

  /**
   * @brief Pull every remaining sample
   */
  Trajectory drain();

  // Number of samples the stream produces in total
  [[nodiscard]] std::size_t sampleCount() const;

  // Number of samples produced so far
  [[nodiscard]] std::size_t emitted() const;

  [[nodiscard]] bool exhausted() const;

  [[nodiscard]] std::size_t acceptedSteps() const;
  [[nodiscard]] std::size_t rejectedSteps() const;

  [[nodiscard]] const Config& getConfig() const;

private:
  using OdeState = std::vector<double>;
  using Stepper = boost::numeric::odeint::result_of::make_controlled<
    boost::numeric::odeint::runge_kutta_fehlberg78<OdeState>>::type;

  // Adapts a StateDerivativeFunction to the odeint system signature on the
  // flat layout x = [q..., q̇...]
  struct OdeSystem
  {
    StateDerivativeFunction derivative;
    std::size_t dimension{0};

    void operator()(const OdeState& x, OdeState& dxdt, double t) const;
  };

  void advanceTo(double target);
  [[noreturn]] void fail(const std::string& message);

  OdeSystem system_;
  State initial_;
  Config config_;
  Stepper stepper_;
  OdeState x_;
  double time_{0.0};
  double dt_{0.0};
  std::size_t sampleCount_{0};
  std::size_t emitted_{0};
  std::size_t acceptedSteps_{0};
  std::size_t rejectedSteps_{0};
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_SAMPLE_STREAM_HPP
