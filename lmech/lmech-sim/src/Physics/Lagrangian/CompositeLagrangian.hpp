// Ticket: 0003_double_double_pendulum

#ifndef LMECH_SIM_PHYSICS_COMPOSITE_LAGRANGIAN_HPP
#define LMECH_SIM_PHYSICS_COMPOSITE_LAGRANGIAN_HPP

#include <cstddef>
#include <utility>

#include <fmt/format.h>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"

namespace lmech_sim
{

/**
 * @brief Sum of two Lagrangians acting on decoupled sub-states.
 *
 * The composite state stores the first subsystem's coordinates in
 * q[0, firstDimension) and the second's in the remaining entries. The two
 * sub-states share only the time coordinate, so the mass matrix of the
 * composite is block diagonal. Each sub-Lagrangian checks the size of its
 * own slice.
 *
 * @ticket 0003_double_double_pendulum
 */
template <typename First, typename Second>
class CompositeLagrangian
{
public:
  CompositeLagrangian(First first, Second second, std::size_t firstDimension)
    : first_{std::move(first)},
      second_{std::move(second)},
      firstDimension_{firstDimension}
  {
  }

  /**
   * @throws InvalidParametersError if the state leaves no coordinates for
   *         the second subsystem
   */
  template <typename T>
  auto operator()(const GeneralizedState<T>& state) const
  {
    if (state.q.size() <= firstDimension_ ||
        state.qdot.size() != state.q.size())
    {
      throw InvalidParametersError(fmt::format(
        "Composite state needs more than {} coordinates (got q {}, qdot {})",
        firstDimension_,
        state.q.size(),
        state.qdot.size()));
    }
    const std::size_t secondDimension = state.q.size() - firstDimension_;
    return first_(slice(state, 0, firstDimension_)) +
           second_(slice(state, firstDimension_, secondDimension));
  }

  [[nodiscard]] std::size_t firstDimension() const
  {
    return firstDimension_;
  }

private:
  First first_;
  Second second_;
  std::size_t firstDimension_;
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_COMPOSITE_LAGRANGIAN_HPP
