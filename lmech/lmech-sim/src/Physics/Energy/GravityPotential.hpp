// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP
#define LMECH_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP

#include "lmech-sim/src/DataTypes/RectangularState.hpp"

namespace lmech_sim
{

/**
 * @brief Uniform gravitational field potential energy
 *
 * Implements V = m1 g y1 + m2 g y2 with y pointing up, so the bobs hanging
 * below the pivot have negative potential energy.
 *
 * Uniform gravity depends only on height; velocities are ignored.
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
struct GravityPotential
{
  double m1{1.0};  // [kg]
  double m2{3.0};  // [kg]
  double g{9.8};   // Gravitational acceleration magnitude [m/s²]

  template <typename T>
  T operator()(const RectangularState<T>& state) const
  {
    return m1 * g * state.position[1] + m2 * g * state.position[3];
  }
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_GRAVITY_POTENTIAL_HPP
