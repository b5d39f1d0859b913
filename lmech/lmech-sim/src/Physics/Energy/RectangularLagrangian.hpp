// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_RECTANGULAR_LAGRANGIAN_HPP
#define LMECH_SIM_PHYSICS_RECTANGULAR_LAGRANGIAN_HPP

#include "lmech-sim/src/DataTypes/RectangularState.hpp"
#include "lmech-sim/src/Physics/Energy/GravityPotential.hpp"
#include "lmech-sim/src/Physics/Energy/KineticEnergy.hpp"

namespace lmech_sim
{

/**
 * @brief Lagrangian of two point masses in rectangular coordinates, T - V
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
struct RectangularLagrangian
{
  KineticEnergy kinetic;
  GravityPotential potential;

  template <typename T>
  T operator()(const RectangularState<T>& state) const
  {
    return kinetic(state) - potential(state);
  }
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_RECTANGULAR_LAGRANGIAN_HPP
