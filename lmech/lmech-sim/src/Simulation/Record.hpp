// Ticket: 0005_trajectory_post_processing

#ifndef LMECH_SIM_SIMULATION_RECORD_HPP
#define LMECH_SIM_SIMULATION_RECORD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lmech_sim
{

/**
 * @brief Per-sample measurements of a double pendulum trajectory
 *
 * Angles are principal values in (-pi, pi]; velocities are left unwrapped.
 * fieldNames() and values() give the name -> value view consumed by
 * charting and export code, in the declaration order below.
 *
 * @ticket 0005_trajectory_post_processing
 */
struct Record
{
  double t{0.0};          // [s]
  double theta1{0.0};     // [rad]
  double theta2{0.0};     // [rad], relative to the first link
  double thetadot1{0.0};  // [rad/s]
  double thetadot2{0.0};  // [rad/s]
  double x1{0.0};         // [m]
  double y1{0.0};         // [m]
  double x2{0.0};         // [m]
  double y2{0.0};         // [m]
  double dEnergy{0.0};    // Energy drift since the first sample [J]

  static constexpr std::size_t kFieldCount = 10;

  static constexpr std::array<std::string_view, kFieldCount> fieldNames()
  {
    return {"t",
            "theta1",
            "theta2",
            "thetadot1",
            "thetadot2",
            "x1",
            "y1",
            "x2",
            "y2",
            "d_energy"};
  }

  [[nodiscard]] std::array<double, kFieldCount> values() const
  {
    return {t, theta1, theta2, thetadot1, thetadot2, x1, y1, x2, y2, dEnergy};
  }
};

// Which bob (or the link ending at it) an entry describes
enum class BobId : uint8_t
{
  P1,
  P2
};

/**
 * @brief Position of one bob at one sample
 */
struct BobPoint
{
  double t{0.0};
  double x{0.0};
  double y{0.0};
  BobId id{BobId::P1};
};

/**
 * @brief One link at one sample, from (x, y) to (x2, y2)
 *
 * P1 runs from the pivot to the first bob, P2 from the first bob to the
 * second.
 */
struct RodSegment
{
  double t{0.0};
  double x{0.0};
  double y{0.0};
  double x2{0.0};
  double y2{0.0};
  BobId id{BobId::P1};
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_SIMULATION_RECORD_HPP
