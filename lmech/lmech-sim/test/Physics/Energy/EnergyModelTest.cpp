// Ticket: 0001_double_pendulum_lagrangian
// Test: rectangular energy terms

#include <gtest/gtest.h>

#include "lmech-sim/src/DataTypes/RectangularState.hpp"
#include "lmech-sim/src/Physics/Energy/GravityPotential.hpp"
#include "lmech-sim/src/Physics/Energy/KineticEnergy.hpp"
#include "lmech-sim/src/Physics/Energy/RectangularLagrangian.hpp"

namespace lmech_sim
{
namespace test
{

static RectangularState<double> makeRect()
{
  RectangularState<double> state;
  state.position = {0.5, -1.0, 1.2, -1.5};
  state.velocity = {3.0, 0.0, 1.0, 2.0};
  return state;
}

// ========== Kinetic energy ==========

TEST(KineticEnergy, SumsBothBobs)
{
  // ½·2·9 + ½·4·(1 + 4) = 9 + 10
  const KineticEnergy kinetic{.m1 = 2.0, .m2 = 4.0};
  EXPECT_NEAR(kinetic(makeRect()), 19.0, 1e-12);
}

TEST(KineticEnergy, StationaryBobs_ReturnsZero)
{
  RectangularState<double> state = makeRect();
  state.velocity = {0.0, 0.0, 0.0, 0.0};
  EXPECT_DOUBLE_EQ((KineticEnergy{.m1 = 1.0, .m2 = 3.0}(state)), 0.0);
}

// ========== Gravity potential ==========

TEST(GravityPotential, ProportionalToHeight)
{
  // 1·9.8·(-1) + 3·9.8·(-1.5)
  const GravityPotential potential{.m1 = 1.0, .m2 = 3.0, .g = 9.8};
  EXPECT_NEAR(potential(makeRect()), -9.8 - 44.1, 1e-12);
}

TEST(GravityPotential, IgnoresHorizontalPosition)
{
  const GravityPotential potential{.m1 = 1.0, .m2 = 3.0, .g = 9.8};
  RectangularState<double> shifted = makeRect();
  shifted.position[0] += 10.0;
  shifted.position[2] -= 4.0;
  EXPECT_DOUBLE_EQ(potential(shifted), potential(makeRect()));
}

TEST(GravityPotential, ZeroGravity_ReturnsZero)
{
  const GravityPotential potential{.m1 = 1.0, .m2 = 3.0, .g = 0.0};
  EXPECT_DOUBLE_EQ(potential(makeRect()), 0.0);
}

// ========== Rectangular Lagrangian ==========

TEST(RectangularLagrangian, KineticMinusPotential)
{
  const RectangularLagrangian lagrangian{
    .kinetic = KineticEnergy{.m1 = 2.0, .m2 = 4.0},
    .potential = GravityPotential{.m1 = 2.0, .m2 = 4.0, .g = 10.0}};

  // T = 19, V = 2·10·(-1) + 4·10·(-1.5) = -80
  EXPECT_NEAR(lagrangian(makeRect()), 99.0, 1e-12);
}

}  // namespace test
}  // namespace lmech_sim
