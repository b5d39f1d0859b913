// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_GENERALIZED_LIFT_HPP
#define LMECH_SIM_PHYSICS_GENERALIZED_LIFT_HPP

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/DataTypes/RectangularState.hpp"
#include "lmech-sim/src/Utils/AutoDiff.hpp"

namespace lmech_sim
{

/**
 * @brief Lift a function of rectangular state through a coordinate transform
 *
 * Produces a function of generalized state:
 *
 *   L(t, q, q̇) = rectFn(t, x(t, q), ∂x/∂t + ∂x/∂q · q̇)
 *
 * The velocity part is the exact differential of the transform, obtained by
 * evaluating the transform once on q + q̇ ε with ε a first-order
 * infinitesimal (see Utils/AutoDiff.hpp for the dimension layout). The value
 * part of the result is x and the ε part is ẋ.
 *
 * Transform requirements: callable as transform(t, q) on any scalar type,
 * returning std::array<T, 4>; it must not depend on q̇.
 *
 * @tparam RectFn Callable on RectangularState<R> for any scalar type R
 * @tparam Transform Coordinate transform, e.g. AnglesToRect
 * @ticket 0001_double_pendulum_lagrangian
 */
template <typename RectFn, typename Transform>
class GeneralizedLift
{
public:
  GeneralizedLift(RectFn rectFn, Transform transform)
    : rectFn_{std::move(rectFn)}, transform_{std::move(transform)}
  {
  }

  template <typename T>
  auto operator()(const GeneralizedState<T>& state) const
  {
    const auto eps = liftInfinitesimal();
    using Lifted = std::decay_t<decltype(state.t + eps)>;

    const Lifted t = state.t + eps;
    std::vector<Lifted> q;
    q.reserve(state.q.size());
    for (std::size_t i = 0; i < state.q.size(); ++i)
    {
      q.push_back(state.q[i] + state.qdot[i] * eps);
    }

    const auto x = transform_(t, q);

    using Rect = std::decay_t<decltype(x[0].derivative(0))>;
    RectangularState<Rect> rect;
    rect.t = t.derivative(0);
    for (std::size_t k = 0; k < x.size(); ++k)
    {
      rect.position[k] = x[k].derivative(0);
      rect.velocity[k] = x[k].derivative(1);
    }
    return rectFn_(rect);
  }

  [[nodiscard]] const RectFn& rectangular() const
  {
    return rectFn_;
  }

  [[nodiscard]] const Transform& transform() const
  {
    return transform_;
  }

private:
  RectFn rectFn_;
  Transform transform_;
};

/**
 * @brief Build the lift of a rectangular function through a transform
 */
template <typename RectFn, typename Transform>
GeneralizedLift<RectFn, Transform> liftToGeneralized(RectFn rectFn,
                                                     Transform transform)
{
  return GeneralizedLift<RectFn, Transform>{std::move(rectFn),
                                            std::move(transform)};
}

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_GENERALIZED_LIFT_HPP
