// Ticket: 0002_sample_stream_integrator

#include "lmech-sim/src/Physics/Integration/SampleStream.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

namespace odeint = boost::numeric::odeint;

namespace
{

// Output times are k * stepSize; the slack absorbs the rounding of
// horizon / stepSize (e.g. 50 / 0.01) so the sample at the horizon is kept.
constexpr double kSampleCountSlack = 1e-9;

void requirePositive(const char* name, double value)
{
  if (!std::isfinite(value) || value <= 0.0)
  {
    throw InvalidParametersError(
      fmt::format("{} must be finite and positive, got {}", name, value));
  }
}

bool allFinite(const std::vector<double>& values)
{
  return std::all_of(values.begin(),
                     values.end(),
                     [](double v) { return std::isfinite(v); });
}

}  // namespace

void SampleStream::OdeSystem::operator()(const OdeState& x,
                                         OdeState& dxdt,
                                         double t) const
{
  State state;
  state.t = t;
  state.q.assign(x.begin(),
                 x.begin() + static_cast<std::ptrdiff_t>(dimension));
  state.qdot.assign(x.begin() + static_cast<std::ptrdiff_t>(dimension),
                    x.end());

  const State rate = derivative(state);
  if (rate.q.size() != dimension || rate.qdot.size() != dimension)
  {
    throw InvalidParametersError(fmt::format(
      "State derivative returned {} / {} components, expected {}",
      rate.q.size(),
      rate.qdot.size(),
      dimension));
  }

  std::copy(rate.q.begin(), rate.q.end(), dxdt.begin());
  std::copy(rate.qdot.begin(),
            rate.qdot.end(),
            dxdt.begin() + static_cast<std::ptrdiff_t>(dimension));
}

SampleStream::SampleStream(StateDerivativeFunction derivative,
                           State initial,
                           const Config& config)
  : system_{std::move(derivative), initial.q.size()},
    initial_{std::move(initial)},
    config_{config},
    stepper_{odeint::make_controlled(
      config.epsilon,
      config.epsilon,
      odeint::runge_kutta_fehlberg78<OdeState>{})}
{
  requirePositive("Step size", config_.stepSize);
  requirePositive("Horizon", config_.horizon);
  requirePositive("Epsilon", config_.epsilon);
  requirePositive("Minimum step size", config_.minStepSize);
  if (!system_.derivative)
  {
    throw InvalidParametersError("State derivative function is empty");
  }
  if (initial_.q.empty() || !initial_.isConsistent())
  {
    throw InvalidParametersError(fmt::format(
      "Initial state must have matching, non-empty q and qdot (got {} and "
      "{})",
      initial_.q.size(),
      initial_.qdot.size()));
  }
  if (!std::isfinite(initial_.t) || initial_.t > config_.horizon)
  {
    throw InvalidParametersError(
      fmt::format("Initial time {} lies beyond the horizon {}",
                  initial_.t,
                  config_.horizon));
  }

  const double intervals =
    std::floor((config_.horizon - initial_.t) / config_.stepSize +
               kSampleCountSlack);
  sampleCount_ = static_cast<std::size_t>(intervals) + 1;

  x_ = initial_.q;
  x_.insert(x_.end(), initial_.qdot.begin(), initial_.qdot.end());
  time_ = initial_.t;
  dt_ = config_.stepSize;

  spdlog::debug(
    "SampleStream: {} samples of {} s up to t = {}, epsilon = {}, {} "
    "coordinates",
    sampleCount_,
    config_.stepSize,
    config_.horizon,
    config_.epsilon,
    system_.dimension);
}

std::optional<State> SampleStream::next()
{
  if (exhausted())
  {
    return std::nullopt;
  }

  if (emitted_ == 0)
  {
    ++emitted_;
    return initial_;
  }

  const double target =
    initial_.t + static_cast<double>(emitted_) * config_.stepSize;
  advanceTo(target);
  ++emitted_;

  if (exhausted())
  {
    spdlog::debug("SampleStream: finished at t = {} after {} accepted and {} "
                  "rejected substeps",
                  target,
                  acceptedSteps_,
                  rejectedSteps_);
  }

  State sample;
  sample.t = target;
  sample.q.assign(x_.begin(),
                  x_.begin() + static_cast<std::ptrdiff_t>(system_.dimension));
  sample.qdot.assign(
    x_.begin() + static_cast<std::ptrdiff_t>(system_.dimension), x_.end());
  return sample;
}

Trajectory SampleStream::drain()
{
  Trajectory samples;
  samples.reserve(sampleCount_ - emitted_);
  while (auto sample = next())
  {
    samples.push_back(std::move(*sample));
  }
  return samples;
}

void SampleStream::advanceTo(double target)
{
  odeint::failed_step_checker failChecker{config_.maxFailedSteps};

  while (time_ < target)
  {
    // Truncate the substep so the last one lands on the output time
    const bool reachesTarget = time_ + dt_ >= target;
    double dt = reachesTarget ? target - time_ : dt_;

    const odeint::controlled_step_result result =
      stepper_.try_step(std::ref(system_), x_, time_, dt);

    if (result == odeint::success)
    {
      failChecker.reset();
      ++acceptedSteps_;
      if (!allFinite(x_))
      {
        fail(fmt::format("State became non-finite at t = {}", time_));
      }
      if (reachesTarget)
      {
        time_ = target;
      }
      else
      {
        dt_ = dt;
        if (dt_ < config_.minStepSize)
        {
          fail(fmt::format(
            "Step size {} fell below the minimum {} at t = {}",
            dt_,
            config_.minStepSize,
            time_));
        }
      }
      continue;
    }

    ++rejectedSteps_;
    dt_ = dt;
    if (dt_ < config_.minStepSize)
    {
      fail(fmt::format(
        "Step size {} fell below the minimum {} at t = {} while meeting "
        "epsilon = {}",
        dt_,
        config_.minStepSize,
        time_,
        config_.epsilon));
    }

    try
    {
      failChecker();
    }
    catch (const odeint::odeint_error& e)
    {
      fail(fmt::format("Step adjustment failed at t = {}: {}", time_, e.what()));
    }
  }
}

void SampleStream::fail(const std::string& message)
{
  emitted_ = sampleCount_;
  spdlog::warn("SampleStream: {}", message);
  throw NumericalInstabilityError(message, time_);
}

std::size_t SampleStream::sampleCount() const
{
  return sampleCount_;
}

std::size_t SampleStream::emitted() const
{
  return emitted_;
}

bool SampleStream::exhausted() const
{
  return emitted_ >= sampleCount_;
}

std::size_t SampleStream::acceptedSteps() const
{
  return acceptedSteps_;
}

std::size_t SampleStream::rejectedSteps() const
{
  return rejectedSteps_;
}

const SampleStream::Config& SampleStream::getConfig() const
{
  return config_;
}

}  // namespace lmech_sim
