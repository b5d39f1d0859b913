// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_KINETIC_ENERGY_HPP
#define LMECH_SIM_PHYSICS_KINETIC_ENERGY_HPP

#include "lmech-sim/src/DataTypes/RectangularState.hpp"

namespace lmech_sim
{

/**
 * @brief Kinetic energy of two point masses
 *
 * T = ½ m1 (ẋ1² + ẏ1²) + ½ m2 (ẋ2² + ẏ2²)
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
struct KineticEnergy
{
  double m1{1.0};  // [kg]
  double m2{3.0};  // [kg]

  template <typename T>
  T operator()(const RectangularState<T>& state) const
  {
    const auto& v = state.velocity;
    return 0.5 * m1 * (v[0] * v[0] + v[1] * v[1]) +
           0.5 * m2 * (v[2] * v[2] + v[3] * v[3]);
  }
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_KINETIC_ENERGY_HPP
