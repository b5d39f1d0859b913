// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_DATATYPES_RECTANGULAR_STATE_HPP
#define LMECH_SIM_DATATYPES_RECTANGULAR_STATE_HPP

#include <array>

namespace lmech_sim
{

/**
 * @brief Local tuple of two point masses in the plane.
 *
 * Layout of position and velocity: (x1, y1, x2, y2) and (ẋ1, ẏ1, ẋ2, ẏ2).
 */
template <typename T>
struct RectangularState
{
  T t{};
  std::array<T, 4> position{};
  std::array<T, 4> velocity{};
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_DATATYPES_RECTANGULAR_STATE_HPP
