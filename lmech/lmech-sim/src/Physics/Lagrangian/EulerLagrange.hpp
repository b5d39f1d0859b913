// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_PHYSICS_EULER_LAGRANGE_HPP
#define LMECH_SIM_PHYSICS_EULER_LAGRANGE_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lmech-sim/src/DataTypes/GeneralizedState.hpp"
#include "lmech-sim/src/Physics/Integration/StateDerivative.hpp"
#include "lmech-sim/src/Physics/SimulationErrors.hpp"
#include "lmech-sim/src/Utils/AutoDiff.hpp"

namespace lmech_sim
{

/**
 * @brief Value and directional derivatives of a Lagrangian at one state
 *
 * For directions u and v in (t, q, q̇) space:
 * first = D_u L, second = D_v L, mixed = D_u D_v L.
 */
struct DirectionalDerivatives
{
  double value{0.0};
  double first{0.0};
  double second{0.0};
  double mixed{0.0};
};

namespace detail
{

inline void requireConsistent(const State& state)
{
  if (state.q.empty() || !state.isConsistent())
  {
    throw InvalidParametersError(fmt::format(
      "State must have matching, non-empty q and qdot (got {} and {})",
      state.q.size(),
      state.qdot.size()));
  }
}

inline State zeroTangent(std::size_t dimension)
{
  State tangent;
  tangent.t = 0.0;
  tangent.q.assign(dimension, 0.0);
  tangent.qdot.assign(dimension, 0.0);
  return tangent;
}

inline State coordinateDirection(std::size_t dimension, std::size_t index)
{
  State tangent = zeroTangent(dimension);
  tangent.q[index] = 1.0;
  return tangent;
}

inline State velocityDirection(std::size_t dimension, std::size_t index)
{
  State tangent = zeroTangent(dimension);
  tangent.qdot[index] = 1.0;
  return tangent;
}

}  // namespace detail

/**
 * @brief Exact first and mixed second directional derivatives of L
 *
 * Seeds every component z of the state as z + a u_z + b v_z, with a and b
 * on separate autodiff dimensions, evaluates the Lagrangian once, and reads
 * the Taylor coefficients.
 *
 * @param lagrangian Callable on GeneralizedState<LagrangianJet>
 * @param state Point of evaluation
 * @param u First direction, same shape as state
 * @param v Second direction, same shape as state
 */
template <typename Lagrangian>
DirectionalDerivatives differentiateAlong(const Lagrangian& lagrangian,
                                          const State& state,
                                          const State& u,
                                          const State& v)
{
  const auto a = firstDirectionSeed();
  const auto b = secondDirectionSeed();
  const auto seed = [&a, &b](double z, double du, double dv) -> LagrangianJet
  { return z + a * du + b * dv; };

  GeneralizedState<LagrangianJet> jet;
  jet.t = seed(state.t, u.t, v.t);
  jet.q.reserve(state.q.size());
  jet.qdot.reserve(state.qdot.size());
  for (std::size_t i = 0; i < state.q.size(); ++i)
  {
    jet.q.push_back(seed(state.q[i], u.q[i], v.q[i]));
    jet.qdot.push_back(seed(state.qdot[i], u.qdot[i], v.qdot[i]));
  }

  const DirectionalJet result = toDirectionalJet(lagrangian(jet));
  return DirectionalDerivatives{.value = result.derivative(0, 0),
                                .first = result.derivative(1, 0),
                                .second = result.derivative(0, 1),
                                .mixed = result.derivative(1, 1)};
}

/**
 * @brief Euler-Lagrange residual d/dt(∂L/∂q̇) - ∂L/∂q at one state
 *
 * The total time derivative is taken along the flow (1, q̇, q̈):
 *
 *   d/dt ∂L/∂q̇ᵢ = ∂²L/∂q̇ᵢ∂t + Σₖ ∂²L/∂q̇ᵢ∂qₖ q̇ₖ + Σₖ ∂²L/∂q̇ᵢ∂q̇ₖ q̈ₖ
 *
 * @param lagrangian Lagrangian of the system
 * @param state (t, q, q̇)
 * @param qddot Generalized accelerations
 * @return Residual per coordinate; zero along a physical motion
 * @throws InvalidParametersError on mismatched dimensions
 */
template <typename Lagrangian>
Eigen::VectorXd eulerLagrangeResidual(const Lagrangian& lagrangian,
                                      const State& state,
                                      const Eigen::VectorXd& qddot)
{
  detail::requireConsistent(state);
  const std::size_t n = state.dimension();
  if (static_cast<std::size_t>(qddot.size()) != n)
  {
    throw InvalidParametersError(fmt::format(
      "Expected {} accelerations, got {}", n, qddot.size()));
  }

  State flow = detail::zeroTangent(n);
  flow.t = 1.0;
  flow.q = state.qdot;
  flow.qdot.assign(qddot.data(), qddot.data() + n);
  const State none = detail::zeroTangent(n);

  Eigen::VectorXd residual(static_cast<Eigen::Index>(n));
  for (std::size_t i = 0; i < n; ++i)
  {
    const double dMomentumDt =
      differentiateAlong(
        lagrangian, state, detail::velocityDirection(n, i), flow)
        .mixed;
    const double generalizedForce =
      differentiateAlong(
        lagrangian, state, detail::coordinateDirection(n, i), none)
        .first;
    residual[static_cast<Eigen::Index>(i)] = dMomentumDt - generalizedForce;
  }
  return residual;
}

/**
 * @brief Lagrange equations evaluated along a path q(t)
 *
 * q, q̇ and q̈ at time t are read from a second-order jet in t, so the
 * residual is exact for any path the jet can evaluate.
 *
 * @param path Callable as path(T t) -> std::vector<T> for any scalar T
 * @param t Time at which to evaluate [s]
 */
template <typename Lagrangian, typename Path>
Eigen::VectorXd lagrangeEquations(const Lagrangian& lagrangian,
                                  const Path& path,
                                  double t)
{
  const auto tau = boost::math::differentiation::make_fvar<double, 2>(t);
  const auto q = path(tau);

  State state;
  state.t = t;
  Eigen::VectorXd qddot(static_cast<Eigen::Index>(q.size()));
  for (std::size_t k = 0; k < q.size(); ++k)
  {
    state.q.push_back(q[k].derivative(0));
    state.qdot.push_back(q[k].derivative(1));
    qddot[static_cast<Eigen::Index>(k)] = q[k].derivative(2);
  }
  return eulerLagrangeResidual(lagrangian, state, qddot);
}

/**
 * @brief Explicit state derivative obtained by solving the Euler-Lagrange
 * system for q̈
 *
 * Solves M q̈ = ∂L/∂q - ∂²L/∂q̇∂t - (∂²L/∂q̇∂q) q̇ with M = ∂²L/∂q̇∂q̇.
 * All partials come from differentiateAlong(), so they are exact.
 *
 * A singular M is a configuration error (e.g. a massless or zero-length
 * link) and raises DegenerateSystemError; it is never retried.
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
template <typename Lagrangian>
class LagrangianStateDerivative
{
public:
  explicit LagrangianStateDerivative(Lagrangian lagrangian)
    : lagrangian_{std::move(lagrangian)}
  {
  }

  /**
   * @brief (1, q̇, q̈) at the given state
   * @throws DegenerateSystemError if the mass matrix is singular
   * @throws InvalidParametersError on mismatched q/q̇
   */
  [[nodiscard]] State operator()(const State& state) const
  {
    const Eigen::VectorXd qddot = accelerations(state);

    State derivative;
    derivative.t = 1.0;
    derivative.q = state.qdot;
    derivative.qdot.assign(qddot.data(), qddot.data() + qddot.size());
    return derivative;
  }

  [[nodiscard]] Eigen::VectorXd accelerations(const State& state) const
  {
    detail::requireConsistent(state);
    const std::size_t n = state.dimension();

    State flow = detail::zeroTangent(n);
    flow.t = 1.0;
    flow.q = state.qdot;
    const State none = detail::zeroTangent(n);

    Eigen::VectorXd rhs(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i)
    {
      const double generalizedForce =
        differentiateAlong(
          lagrangian_, state, detail::coordinateDirection(n, i), none)
          .first;
      const double velocityTerms =
        differentiateAlong(
          lagrangian_, state, detail::velocityDirection(n, i), flow)
          .mixed;
      rhs[static_cast<Eigen::Index>(i)] = generalizedForce - velocityTerms;
    }

    const auto lu = factorize(state);
    return lu.solve(rhs);
  }

  /**
   * @brief Generalized mass matrix ∂²L/∂q̇∂q̇
   */
  [[nodiscard]] Eigen::MatrixXd massMatrix(const State& state) const
  {
    detail::requireConsistent(state);
    const std::size_t n = state.dimension();

    Eigen::MatrixXd mass(static_cast<Eigen::Index>(n),
                         static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i)
    {
      for (std::size_t j = i; j < n; ++j)
      {
        const double mij =
          differentiateAlong(lagrangian_,
                             state,
                             detail::velocityDirection(n, i),
                             detail::velocityDirection(n, j))
            .mixed;
        mass(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = mij;
        mass(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i)) = mij;
      }
    }
    return mass;
  }

  /**
   * @brief Check that the equations of motion are solvable at a state
   * @throws DegenerateSystemError if the mass matrix is singular
   */
  void validate(const State& state) const
  {
    static_cast<void>(factorize(state));
  }

  [[nodiscard]] const Lagrangian& lagrangian() const
  {
    return lagrangian_;
  }

private:
  Eigen::FullPivLU<Eigen::MatrixXd> factorize(const State& state) const
  {
    Eigen::FullPivLU<Eigen::MatrixXd> lu{massMatrix(state)};
    if (!lu.isInvertible())
    {
      spdlog::warn("Singular mass matrix at t = {}: rank {} of {}",
                   state.t,
                   lu.rank(),
                   state.dimension());
      throw DegenerateSystemError(fmt::format(
        "Mass matrix d2L/dqdot2 is singular at t = {} (rank {} of {})",
        state.t,
        lu.rank(),
        state.dimension()));
    }
    return lu;
  }

  Lagrangian lagrangian_;
};

/**
 * @brief Total energy E = Σ q̇ᵢ ∂L/∂q̇ᵢ - L
 *
 * The sum is a single directional derivative of L along (0, 0, q̇).
 */
template <typename Lagrangian>
class LagrangianEnergy
{
public:
  explicit LagrangianEnergy(Lagrangian lagrangian)
    : lagrangian_{std::move(lagrangian)}
  {
  }

  [[nodiscard]] double operator()(const State& state) const
  {
    detail::requireConsistent(state);
    const std::size_t n = state.dimension();

    State alongVelocity = detail::zeroTangent(n);
    alongVelocity.qdot = state.qdot;
    const auto d = differentiateAlong(
      lagrangian_, state, alongVelocity, detail::zeroTangent(n));
    return d.first - d.value;
  }

private:
  Lagrangian lagrangian_;
};

/**
 * @brief Type-erased state derivative of a Lagrangian, ready for the
 * integrator
 */
template <typename Lagrangian>
StateDerivativeFunction lagrangianToStateDerivative(Lagrangian lagrangian)
{
  return LagrangianStateDerivative<Lagrangian>{std::move(lagrangian)};
}

/**
 * @brief Type-erased energy observable of a Lagrangian
 */
template <typename Lagrangian>
std::function<double(const State&)> lagrangianToEnergy(Lagrangian lagrangian)
{
  return LagrangianEnergy<Lagrangian>{std::move(lagrangian)};
}

}  // namespace lmech_sim

#endif  // LMECH_SIM_PHYSICS_EULER_LAGRANGE_HPP
