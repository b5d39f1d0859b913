// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_DATATYPES_GENERALIZED_STATE_HPP
#define LMECH_SIM_DATATYPES_GENERALIZED_STATE_HPP

#include <cstddef>
#include <vector>

namespace lmech_sim
{

/**
 * @brief Local tuple (t, q, q̇) of a mechanical system in generalized
 * coordinates.
 *
 * Templated on the scalar type so the same tuple carries plain doubles during
 * integration and automatic-differentiation jets while deriving equations of
 * motion.
 *
 * Invariant: q and qdot always have the same length.
 *
 * Composite systems store their sub-states back to back in q and qdot; use
 * slice() to view one of them.
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
template <typename T>
struct GeneralizedState
{
  T t{};                // Time [s]
  std::vector<T> q;     // Generalized coordinates
  std::vector<T> qdot;  // Generalized velocities

  [[nodiscard]] std::size_t dimension() const
  {
    return q.size();
  }

  [[nodiscard]] bool isConsistent() const
  {
    return q.size() == qdot.size();
  }
};

using State = GeneralizedState<double>;

// Sequence of sampled states produced by one integration run
using Trajectory = std::vector<State>;

/**
 * @brief Extract a sub-state sharing the parent's time coordinate
 * @param state Composite state
 * @param offset Index of the first coordinate of the sub-state
 * @param count Number of coordinates in the sub-state
 * @return Sub-state (t, q[offset, offset+count), qdot[offset, offset+count))
 */
template <typename T>
GeneralizedState<T> slice(const GeneralizedState<T>& state,
                          std::size_t offset,
                          std::size_t count)
{
  GeneralizedState<T> sub;
  sub.t = state.t;
  sub.q.assign(state.q.begin() + static_cast<std::ptrdiff_t>(offset),
               state.q.begin() + static_cast<std::ptrdiff_t>(offset + count));
  sub.qdot.assign(
    state.qdot.begin() + static_cast<std::ptrdiff_t>(offset),
    state.qdot.begin() + static_cast<std::ptrdiff_t>(offset + count));
  return sub;
}

}  // namespace lmech_sim

#endif  // LMECH_SIM_DATATYPES_GENERALIZED_STATE_HPP
