// Ticket: 0002_sample_stream_integrator

#ifndef LMECH_SIM_PHYSICS_STATE_DERIVATIVE_HPP
#define LMECH_SIM_PHYSICS_STATE_DERIVATIVE_HPP

#include <functional>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"

namespace lmech_sim
{

/**
 * @brief Explicit first-order right-hand side of the equations of motion
 *
 * Maps (t, q, q̇) to its time derivative (1, q̇, q̈). The returned q and qdot
 * must have the input's dimension.
 *
 * Type-erased so the integrator does not depend on how the equations of
 * motion were derived.
 */
using StateDerivativeFunction = std::function<State(const State&)>;

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_STATE_DERIVATIVE_HPP
