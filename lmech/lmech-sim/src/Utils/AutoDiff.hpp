// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_UTILS_AUTODIFF_HPP
#define LMECH_SIM_UTILS_AUTODIFF_HPP

#include <type_traits>

#include <boost/math/differentiation/autodiff.hpp>

namespace lmech_sim
{

/**
 * Forward-mode jets used to differentiate Lagrangians.
 *
 * Boost.Math autodiff nests one dimension per variable, outermost first.
 * Variables must be created directly at their dimension; converting a jet
 * into a deeper jet shifts its dimensions. The layout below is therefore
 * fixed across the library:
 *
 *   dimension 0  coordinate lift infinitesimal ε (order 1 where lifted)
 *   dimension 1  first direction a
 *   dimension 2  second direction b
 */

// Scalar fed into a Lagrangian while deriving equations of motion
using LagrangianJet =
  boost::math::differentiation::autodiff_fvar<double, 0, 1, 1>;

// Scalar a Lagrangian returns for LagrangianJet input once the lift
// dimension has been consumed
using DirectionalJet =
  boost::math::differentiation::autodiff_fvar<double, 1, 1>;

// First-order infinitesimal on the lift dimension
inline auto liftInfinitesimal()
{
  return boost::math::differentiation::make_fvar<double, 1>(0.0);
}

// Seed for direction a (dimension 1)
inline auto firstDirectionSeed()
{
  return boost::math::differentiation::make_fvar<double, 0, 1>(0.0);
}

// Seed for direction b (dimension 2)
inline auto secondDirectionSeed()
{
  return boost::math::differentiation::make_fvar<double, 0, 0, 1>(0.0);
}

/**
 * @brief Normalize a Lagrangian value to a DirectionalJet
 *
 * Lagrangians built through a coordinate lift already return a
 * DirectionalJet. Lagrangians written directly in generalized coordinates
 * return the LagrangianJet they were fed; its lift dimension is constant
 * and is dropped here.
 */
template <typename Jet>
DirectionalJet toDirectionalJet(const Jet& value)
{
  if constexpr (std::is_same_v<Jet, LagrangianJet>)
  {
    return value.derivative(0);
  }
  else
  {
    static_assert(std::is_same_v<Jet, DirectionalJet>,
                  "Lagrangian evaluated on LagrangianJet returned an "
                  "unexpected scalar type");
    return value;
  }
}

}  // namespace lmech_sim

#endif  // LMECH_SIM_UTILS_AUTODIFF_HPP
