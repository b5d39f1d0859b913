// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_ANGLES_TO_RECT_HPP
#define LMECH_SIM_PHYSICS_ANGLES_TO_RECT_HPP

#include <array>
#include <cmath>
#include <vector>

#include <fmt/format.h>

#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

/**
 * @brief Coordinate transform from joint angles to bob positions.
 *
 * θ1 is measured from the downward vertical, θ2 relative to the first link:
 *
 *   x1 = l1 sin θ1          y1 = -l1 cos θ1
 *   x2 = x1 + l2 sin(θ1+θ2) y2 = y1 - l2 cos(θ1+θ2)
 *
 * Evaluated on any scalar type that provides sin/cos (found by ADL for
 * automatic-differentiation jets).
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
struct AnglesToRect
{
  double l1{1.0};  // Length of the first link [m]
  double l2{0.9};  // Length of the second link [m]

  /**
   * @brief Rectangular coordinates (x1, y1, x2, y2) of both bobs
   * @param t Time (the transform is time independent)
   * @param q Joint angles (θ1, θ2) [rad]
   * @throws InvalidParametersError if q does not hold exactly two angles
   */
  template <typename T>
  std::array<T, 4> operator()(const T& /* t */, const std::vector<T>& q) const
  {
    using std::cos;
    using std::sin;

    if (q.size() != 2)
    {
      throw InvalidParametersError(fmt::format(
        "Double pendulum state needs 2 joint angles (got {})", q.size()));
    }

    const T theta12 = q[0] + q[1];
    const T x1 = l1 * sin(q[0]);
    const T y1 = -(l1 * cos(q[0]));
    const T x2 = x1 + l2 * sin(theta12);
    const T y2 = y1 - l2 * cos(theta12);
    return {x1, y1, x2, y2};
  }
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_ANGLES_TO_RECT_HPP
