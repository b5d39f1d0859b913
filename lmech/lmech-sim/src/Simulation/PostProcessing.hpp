// Ticket: 0005_trajectory_post_processing

#ifndef LMECH_SIM_SIMULATION_POST_PROCESSING_HPP
#define LMECH_SIM_SIMULATION_POST_PROCESSING_HPP

#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/DataTypes/PhysicalParameters.hpp"
#include "lmech-sim/src/Simulation/Record.hpp"

namespace lmech_sim
{

/**
 * @brief Convert raw double pendulum states into measurement records
 *
 * The energy drift of each record is measured against the first state.
 *
 * @param states Trajectory of a double pendulum (two coordinates)
 * @param params Physical constants the trajectory was produced with
 * @return One record per state; empty for an empty trajectory
 * @throws InvalidParametersError if a state is not a double pendulum state
 * @ticket 0005_trajectory_post_processing
 */
std::vector<Record> transformData(const Trajectory& states,
                                  const PhysicalParameters& params = {});

/**
 * @brief Both bob positions of every record, P1 before P2
 */
std::vector<BobPoint> pointsData(const std::vector<Record>& records);

/**
 * @brief Both links of every record, P1 before P2
 */
std::vector<RodSegment> segmentsData(const std::vector<Record>& records);

}  // namespace lmech_sim

#endif  // LMECH_SIM_SIMULATION_POST_PROCESSING_HPP
