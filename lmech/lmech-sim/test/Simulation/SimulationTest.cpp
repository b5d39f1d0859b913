// Ticket: 0001_double_pendulum_lagrangian
// Test: end-to-end double pendulum and double-double pendulum runs

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"
#include "lmech-sim/src/Simulation/PostProcessing.hpp"
#include "lmech-sim/src/Simulation/Simulation.hpp"

namespace lmech_sim
{
namespace test
{

// ========== Reference run ==========

// The 50 s chaotic run is shared by every test that inspects it
class ChaoticRunTest : public ::testing::Test
{
protected:
  static void SetUpTestSuite()
  {
    trajectory_ = run(kDefaultStep, kDefaultHorizon, kChaoticInitialQ);
  }

  static void TearDownTestSuite()
  {
    trajectory_.reset();
  }

  static const Trajectory& trajectory()
  {
    return *trajectory_;
  }

private:
  static std::optional<Trajectory> trajectory_;
};

std::optional<Trajectory> ChaoticRunTest::trajectory_;

TEST_F(ChaoticRunTest, SampleCount_CoversHorizon)
{
  ASSERT_EQ(trajectory().size(), 5001U);
  EXPECT_NEAR(trajectory().back().t, kDefaultHorizon, kDefaultStep);
}

TEST_F(ChaoticRunTest, FirstSample_IsReleaseFromRest)
{
  const State& first = trajectory().front();
  EXPECT_EQ(first.t, 0.0);
  EXPECT_EQ(first.q, kChaoticInitialQ);
  EXPECT_EQ(first.qdot, (std::vector<double>{0.0, 0.0}));
}

TEST_F(ChaoticRunTest, Times_IncreaseByStep)
{
  for (std::size_t k = 1; k < trajectory().size(); ++k)
  {
    ASSERT_NEAR(trajectory()[k].t - trajectory()[k - 1].t, kDefaultStep, 1e-9)
      << "k = " << k;
  }
}

TEST_F(ChaoticRunTest, EnergyIsConserved)
{
  const std::vector<Record> records = transformData(trajectory());

  ASSERT_EQ(records.size(), trajectory().size());
  double worst = 0.0;
  for (const auto& r : records)
  {
    worst = std::max(worst, std::abs(r.dEnergy));
  }
  EXPECT_LT(worst, 1e-6);
}

TEST_F(ChaoticRunTest, FirstLinkSwingsDown)
{
  const double start = kChaoticInitialQ[0];
  const auto swung = std::any_of(trajectory().begin(),
                                 trajectory().end(),
                                 [start](const State& s)
                                 { return std::abs(s.q[0] - start) > 1.0; });
  EXPECT_TRUE(swung);
}

// ========== Determinism ==========

TEST(Simulation, RepeatedRuns_AreBitIdentical)
{
  const Trajectory a = run(0.01, 5.0, kChaoticInitialQ);
  const Trajectory b = run(0.01, 5.0, kChaoticInitialQ);

  ASSERT_EQ(a.size(), b.size());
  for (std::size_t k = 0; k < a.size(); ++k)
  {
    ASSERT_EQ(a[k].t, b[k].t);
    ASSERT_EQ(a[k].q, b[k].q);
    ASSERT_EQ(a[k].qdot, b[k].qdot);
  }
}

TEST(Simulation, ExplicitDefaults_MatchReducedOverload)
{
  const PhysicalParameters p{};
  const Trajectory a = run(0.05, 2.0, kRegularInitialQ);
  const Trajectory b =
    run(0.05, 2.0, p.l1, p.l2, p.m1, p.m2, p.g, kRegularInitialQ);

  ASSERT_EQ(a.size(), b.size());
  EXPECT_EQ(a.back().q, b.back().q);
  EXPECT_EQ(a.back().qdot, b.back().qdot);
}

TEST(Simulation, HangingAtRest_StaysAtRest)
{
  const Trajectory trajectory = run(0.1, 5.0, {0.0, 0.0});

  for (const State& s : trajectory)
  {
    EXPECT_NEAR(s.q[0], 0.0, 1e-12);
    EXPECT_NEAR(s.q[1], 0.0, 1e-12);
  }
}

TEST(Simulation, PartialFinalInterval_IsDropped)
{
  const Trajectory trajectory = run(0.3, 1.0, kRegularInitialQ);
  ASSERT_EQ(trajectory.size(), 4U);
  EXPECT_NEAR(trajectory.back().t, 0.9, 1e-12);
}

// ========== Double-double pendulum ==========

TEST(DoubleDouble, InitialState_LaysOutBothPendulums)
{
  const Trajectory trajectory =
    runDoubleDouble(0.01, 0.01, kChaoticInitialQ, PhysicalParameters{}, 1e-10);

  const State& first = trajectory.front();
  ASSERT_EQ(first.q.size(), 4U);
  EXPECT_EQ(first.q[0], kChaoticInitialQ[0]);
  EXPECT_EQ(first.q[1], kChaoticInitialQ[1]);
  EXPECT_EQ(first.q[2], kChaoticInitialQ[0]);
  EXPECT_EQ(first.q[3], kChaoticInitialQ[1] + 1e-10);
  EXPECT_EQ(first.qdot, (std::vector<double>{0.0, 0.0, 0.0, 0.0}));
}

TEST(DoubleDouble, ZeroPerturbation_DivergenceStaysAtFloor)
{
  const Trajectory trajectory =
    runDoubleDouble(0.01, 10.0, kChaoticInitialQ, PhysicalParameters{}, 0.0);
  const std::vector<double> divergence = divergenceSeries(trajectory);

  ASSERT_EQ(divergence.size(), 1001U);
  for (std::size_t k = 0; k < divergence.size(); ++k)
  {
    ASSERT_EQ(divergence[k], -138.0) << "t = " << trajectory[k].t;
  }
}

TEST(DoubleDouble, HalvesMatchSinglePendulum)
{
  const Trajectory composite =
    runDoubleDouble(0.05, 2.0, kChaoticInitialQ, PhysicalParameters{}, 0.0);
  const Trajectory single = run(0.05, 2.0, kChaoticInitialQ);

  ASSERT_EQ(composite.size(), single.size());
  for (std::size_t k = 0; k < single.size(); ++k)
  {
    EXPECT_NEAR(composite[k].q[0], single[k].q[0], 1e-9);
    EXPECT_NEAR(composite[k].q[1], single[k].q[1], 1e-9);
  }
}

TEST(DoubleDouble, ChaoticPerturbation_Diverges)
{
  const Trajectory trajectory = runDoubleDouble(0.01, 20.0, kChaoticInitialQ);
  const std::vector<double> divergence = divergenceSeries(trajectory);

  ASSERT_EQ(divergence.size(), 2001U);
  EXPECT_NEAR(divergence.front(), std::log(kDefaultPerturbation), 1e-3);
  const double peak = *std::max_element(divergence.begin(), divergence.end());
  EXPECT_GT(peak, divergence.front() + 5.0);
}

// ========== Errors ==========

TEST(Simulation, WrongCoordinateCount_ThrowsInvalidParameters)
{
  EXPECT_THROW(static_cast<void>(run(0.01, 1.0, {0.1})),
               InvalidParametersError);
  EXPECT_THROW(static_cast<void>(run(0.01, 1.0, {0.1, 0.2, 0.3})),
               InvalidParametersError);
  EXPECT_THROW(static_cast<void>(runDoubleDouble(0.01, 1.0, {0.1})),
               InvalidParametersError);
}

TEST(Simulation, NonPositiveStepOrHorizon_ThrowsInvalidParameters)
{
  EXPECT_THROW(static_cast<void>(run(0.0, 1.0, kChaoticInitialQ)),
               InvalidParametersError);
  EXPECT_THROW(static_cast<void>(run(0.01, -1.0, kChaoticInitialQ)),
               InvalidParametersError);
}

TEST(Simulation, NegativeConstant_ThrowsInvalidParameters)
{
  EXPECT_THROW(static_cast<void>(
                 run(0.01, 1.0, 1.0, 0.9, 1.0, 3.0, -9.8, kChaoticInitialQ)),
               InvalidParametersError);
}

TEST(Simulation, MasslessSecondBob_ThrowsDegenerateSystem)
{
  EXPECT_THROW(static_cast<void>(
                 run(0.01, 1.0, 1.0, 0.9, 1.0, 0.0, 9.8, kChaoticInitialQ)),
               DegenerateSystemError);
}

TEST(Simulation, DegenerateSystem_RaisedWithoutEagerValidation)
{
  RunOptions options;
  options.compile = false;
  EXPECT_THROW(static_cast<void>(run(
                 0.01, 1.0, 1.0, 0.0, 1.0, 3.0, 9.8, kChaoticInitialQ, options)),
               DegenerateSystemError);
}

}  // namespace test
}  // namespace lmech_sim
