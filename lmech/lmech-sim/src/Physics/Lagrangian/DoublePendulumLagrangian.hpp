// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_DOUBLE_PENDULUM_LAGRANGIAN_HPP
#define LMECH_SIM_PHYSICS_DOUBLE_PENDULUM_LAGRANGIAN_HPP

#include <cstddef>

#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"
#include "lmech-sim/src/Physics/Energy/RectangularLagrangian.hpp"
#include "lmech-sim/src/Physics/Kinematics/AnglesToRect.hpp"
#include "lmech-sim/src/Physics/Kinematics/GeneralizedLift.hpp"
#include "lmech-sim/src/Physics/Lagrangian/CompositeLagrangian.hpp"

namespace lmech_sim
{

// Generalized coordinates of one double pendulum: (θ1, θ2)
inline constexpr std::size_t kDoublePendulumDimension = 2;

/**
 * @brief Lagrangian of a double pendulum in joint angles
 *
 * The rectangular Lagrangian T - V of the two bobs, lifted through the
 * angles-to-rectangular transform.
 */
using DoublePendulumLagrangian =
  GeneralizedLift<RectangularLagrangian, AnglesToRect>;

/**
 * @brief Two independent double pendulums sharing time
 *
 * Coordinates are laid out (θ1a, θ2a, θ1b, θ2b).
 */
using DoubleDoublePendulumLagrangian =
  CompositeLagrangian<DoublePendulumLagrangian, DoublePendulumLagrangian>;

/**
 * @brief Build the double pendulum Lagrangian
 * @param m1 Mass of the first bob [kg]
 * @param m2 Mass of the second bob [kg]
 * @param l1 Length of the first link [m]
 * @param l2 Length of the second link [m]
 * @param g Gravitational acceleration [m/s²]
 * @throws InvalidParametersError if a constant is negative or not finite
 * @ticket 0001_double_pendulum_lagrangian
 */
DoublePendulumLagrangian buildLagrangian(double m1,
                                         double m2,
                                         double l1,
                                         double l2,
                                         double g);

DoublePendulumLagrangian buildLagrangian(const PhysicalParameters& params);

/**
 * @brief Build the Lagrangian of two identical, uncoupled double pendulums
 * @ticket 0003_double_double_pendulum
 */
DoubleDoublePendulumLagrangian buildDoubleDoubleLagrangian(
  const PhysicalParameters& params);

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_DOUBLE_PENDULUM_LAGRANGIAN_HPP
