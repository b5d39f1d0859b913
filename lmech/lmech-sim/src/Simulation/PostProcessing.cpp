// Ticket: 0005_trajectory_post_processing

#include "lmech-sim/src/Simulation/PostProcessing.hpp"

#include <fmt/format.h>

#include "lmech-sim/src/Diagnostics/EnergyMonitor.hpp"
#include "lmech-sim/src/Environment/Angle.hpp"
#include "lmech-sim/src/Physics/Kinematics/AnglesToRect.hpp"
#include "lmech-sim/src/Physics/Lagrangian/DoublePendulumLagrangian.hpp"
#include "lmech-sim/src/Physics/Lagrangian/EulerLagrange.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

std::vector<Record> transformData(const Trajectory& states,
                                  const PhysicalParameters& params)
{
  std::vector<Record> records;
  if (states.empty())
  {
    return records;
  }

  const EnergyMonitor monitor{lagrangianToEnergy(buildLagrangian(params)),
                              states.front()};
  const AnglesToRect transform{.l1 = params.l1, .l2 = params.l2};

  records.reserve(states.size());
  for (const auto& state : states)
  {
    if (state.q.size() != kDoublePendulumDimension || !state.isConsistent())
    {
      throw InvalidParametersError(fmt::format(
        "Expected a double pendulum state at t = {}, got {} coordinates",
        state.t,
        state.q.size()));
    }

    const auto [x1, y1, x2, y2] = transform(state.t, state.q);
    records.push_back(Record{.t = state.t,
                             .theta1 = principalValue(state.q[0]),
                             .theta2 = principalValue(state.q[1]),
                             .thetadot1 = state.qdot[0],
                             .thetadot2 = state.qdot[1],
                             .x1 = x1,
                             .y1 = y1,
                             .x2 = x2,
                             .y2 = y2,
                             .dEnergy = monitor(state)});
  }
  return records;
}

std::vector<BobPoint> pointsData(const std::vector<Record>& records)
{
  std::vector<BobPoint> points;
  points.reserve(2 * records.size());
  for (const auto& r : records)
  {
    points.push_back(BobPoint{.t = r.t, .x = r.x1, .y = r.y1, .id = BobId::P1});
    points.push_back(BobPoint{.t = r.t, .x = r.x2, .y = r.y2, .id = BobId::P2});
  }
  return points;
}

std::vector<RodSegment> segmentsData(const std::vector<Record>& records)
{
  std::vector<RodSegment> segments;
  segments.reserve(2 * records.size());
  for (const auto& r : records)
  {
    segments.push_back(RodSegment{
      .t = r.t, .x = 0.0, .y = 0.0, .x2 = r.x1, .y2 = r.y1, .id = BobId::P1});
    segments.push_back(RodSegment{
      .t = r.t, .x = r.x1, .y = r.y1, .x2 = r.x2, .y2 = r.y2, .id = BobId::P2});
  }
  return segments;
}

}  // namespace lmech_sim
