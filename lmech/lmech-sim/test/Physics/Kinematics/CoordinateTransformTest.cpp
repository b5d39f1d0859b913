// Ticket: 0001_double_pendulum_lagrangian
// Test: angles-to-rectangular transform and its lift to generalized state

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/Physics/Energy/GravityPotential.hpp"
#include "lmech-sim/src/Physics/Energy/KineticEnergy.hpp"
#include "lmech-sim/src/Physics/Kinematics/AnglesToRect.hpp"
#include "lmech-sim/src/Physics/Kinematics/GeneralizedLift.hpp"

namespace lmech_sim
{
namespace test
{

constexpr double PI = std::numbers::pi;

static State makeState(double theta1,
                       double theta2,
                       double thetadot1,
                       double thetadot2)
{
  return State{.t = 0.0,
               .q = {theta1, theta2},
               .qdot = {thetadot1, thetadot2}};
}

// ========== AnglesToRect ==========

TEST(AnglesToRect, HangingAtRest_BobsBelowPivot)
{
  const AnglesToRect transform{.l1 = 1.0, .l2 = 0.9};
  const auto x = transform(0.0, std::vector<double>{0.0, 0.0});

  EXPECT_NEAR(x[0], 0.0, 1e-15);
  EXPECT_NEAR(x[1], -1.0, 1e-15);
  EXPECT_NEAR(x[2], 0.0, 1e-15);
  EXPECT_NEAR(x[3], -1.9, 1e-15);
}

TEST(AnglesToRect, HangingAtRest_UsesLinkLengths)
{
  const AnglesToRect transform{.l1 = 2.5, .l2 = 0.4};
  const auto x = transform(3.0, std::vector<double>{0.0, 0.0});

  EXPECT_DOUBLE_EQ(x[0], 0.0);
  EXPECT_DOUBLE_EQ(x[1], -2.5);
  EXPECT_DOUBLE_EQ(x[2], 0.0);
  EXPECT_NEAR(x[3], -2.9, 1e-15);
}

TEST(AnglesToRect, FirstLinkHorizontal_SecondLinkExtendsIt)
{
  const AnglesToRect transform{.l1 = 1.0, .l2 = 0.9};
  const auto x = transform(0.0, std::vector<double>{PI / 2, 0.0});

  EXPECT_NEAR(x[0], 1.0, 1e-12);
  EXPECT_NEAR(x[1], 0.0, 1e-12);
  EXPECT_NEAR(x[2], 1.9, 1e-12);
  EXPECT_NEAR(x[3], 0.0, 1e-12);
}

TEST(AnglesToRect, SecondAngleIsRelativeToFirstLink)
{
  // Second link folded back onto the first
  const AnglesToRect transform{.l1 = 1.0, .l2 = 0.9};
  const auto x = transform(0.0, std::vector<double>{PI / 2, PI});

  EXPECT_NEAR(x[2], 0.1, 1e-12);
  EXPECT_NEAR(x[3], 0.0, 1e-12);
}

TEST(AnglesToRect, LinkLengthsArePreserved)
{
  const AnglesToRect transform{.l1 = 1.3, .l2 = 0.7};
  const auto x = transform(0.0, std::vector<double>{0.81, -2.2});

  EXPECT_NEAR(std::hypot(x[0], x[1]), 1.3, 1e-12);
  EXPECT_NEAR(std::hypot(x[2] - x[0], x[3] - x[1]), 0.7, 1e-12);
}

// ========== GeneralizedLift ==========

TEST(GeneralizedLift, VelocityIsDifferentialOfTransform)
{
  const double l1 = 1.0;
  const double l2 = 0.9;
  const auto lifted =
    liftToGeneralized([](const auto& rect) { return rect.velocity[2]; },
                      AnglesToRect{.l1 = l1, .l2 = l2});

  const State s = makeState(0.4, -1.1, 2.0, 0.5);
  // ẋ2 = l1 cos θ1 θ̇1 + l2 cos(θ1+θ2)(θ̇1+θ̇2)
  const double expected = l1 * std::cos(0.4) * 2.0 +
                          l2 * std::cos(0.4 - 1.1) * (2.0 + 0.5);

  EXPECT_NEAR(lifted(s), expected, 1e-12);
}

TEST(GeneralizedLift, PositionIsTransformValue)
{
  const auto lifted =
    liftToGeneralized([](const auto& rect) { return rect.position[3]; },
                      AnglesToRect{.l1 = 1.0, .l2 = 0.9});

  const State s = makeState(0.0, 0.0, 3.0, -1.0);
  EXPECT_NEAR(lifted(s), -1.9, 1e-15);
}

TEST(GeneralizedLift, KineticEnergy_MatchesClosedForm)
{
  const double m1 = 1.0;
  const double m2 = 3.0;
  const double l1 = 1.0;
  const double l2 = 0.9;
  const auto kinetic = liftToGeneralized(KineticEnergy{.m1 = m1, .m2 = m2},
                                         AnglesToRect{.l1 = l1, .l2 = l2});

  const double th2 = 0.6;
  const double w1 = 1.7;
  const double w2 = -0.8;
  const State s = makeState(-0.3, th2, w1, w2);

  // T = ½(m1+m2) l1² ω1² + ½ m2 l2² (ω1+ω2)² + m2 l1 l2 ω1 (ω1+ω2) cos θ2
  const double expected = 0.5 * (m1 + m2) * l1 * l1 * w1 * w1 +
                          0.5 * m2 * l2 * l2 * (w1 + w2) * (w1 + w2) +
                          m2 * l1 * l2 * w1 * (w1 + w2) * std::cos(th2);

  EXPECT_NEAR(kinetic(s), expected, 1e-12);
}

TEST(GeneralizedLift, GravityPotential_MatchesClosedForm)
{
  const double m1 = 1.0;
  const double m2 = 3.0;
  const double g = 9.8;
  const auto potential =
    liftToGeneralized(GravityPotential{.m1 = m1, .m2 = m2, .g = g},
                      AnglesToRect{.l1 = 1.0, .l2 = 0.9});

  const State s = makeState(0.25, 1.4, 0.0, 0.0);
  const double expected = -(m1 + m2) * g * 1.0 * std::cos(0.25) -
                          m2 * g * 0.9 * std::cos(0.25 + 1.4);

  EXPECT_NEAR(potential(s), expected, 1e-12);
}

TEST(GeneralizedLift, PotentialIgnoresVelocity)
{
  const auto potential =
    liftToGeneralized(GravityPotential{.m1 = 1.0, .m2 = 3.0, .g = 9.8},
                      AnglesToRect{.l1 = 1.0, .l2 = 0.9});

  EXPECT_DOUBLE_EQ(potential(makeState(0.5, 0.5, 0.0, 0.0)),
                   potential(makeState(0.5, 0.5, 4.0, -7.0)));
}

}  // namespace test
}  // namespace lmech_sim
