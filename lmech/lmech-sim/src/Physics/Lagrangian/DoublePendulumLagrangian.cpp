// Ticket: 0001_double_pendulum_lagrangian

#include "lmech-sim/src/Physics/Lagrangian/DoublePendulumLagrangian.hpp"

#include <utility>

namespace lmech_sim
{

DoublePendulumLagrangian buildLagrangian(double m1,
                                         double m2,
                                         double l1,
                                         double l2,
                                         double g)
{
  return buildLagrangian(
    PhysicalParameters{.m1 = m1, .m2 = m2, .l1 = l1, .l2 = l2, .g = g});
}

DoublePendulumLagrangian buildLagrangian(const PhysicalParameters& params)
{
  params.validate();

  RectangularLagrangian rect{
    .kinetic = KineticEnergy{.m1 = params.m1, .m2 = params.m2},
    .potential =
      GravityPotential{.m1 = params.m1, .m2 = params.m2, .g = params.g}};

  return liftToGeneralized(std::move(rect),
                           AnglesToRect{.l1 = params.l1, .l2 = params.l2});
}

DoubleDoublePendulumLagrangian buildDoubleDoubleLagrangian(
  const PhysicalParameters& params)
{
  DoublePendulumLagrangian single = buildLagrangian(params);
  return DoubleDoublePendulumLagrangian{
    single, single, kDoublePendulumDimension};
}

}  // namespace lmech_sim
