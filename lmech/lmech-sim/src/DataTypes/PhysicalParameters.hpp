// Ticket: 0001_double_pendulum_lagrangian

#ifndef LMECH_SIM_DATATYPES_PHYSICAL_PARAMETERS_HPP
#define LMECH_SIM_DATATYPES_PHYSICAL_PARAMETERS_HPP

namespace lmech_sim
{

/**
 * @brief Physical constants of a two-link pendulum.
 *
 * Shared read-only by every component of a run. The defaults are the
 * reference configuration used by the reduced-arity run() overload.
 *
 * @ticket 0001_double_pendulum_lagrangian
 */
struct PhysicalParameters
{
  double m1{1.0};  ///< Mass of the first bob [kg]
  double m2{3.0};  ///< Mass of the second bob [kg]
  double l1{1.0};  ///< Length of the first link [m]
  double l2{0.9};  ///< Length of the second link [m]
  double g{9.8};   ///< Gravitational acceleration [m/s²]

  /**
   * @brief Check that every constant is finite and non-negative
   * @throws InvalidParametersError otherwise
   *
   * Zero masses or lengths pass; they surface later as a degenerate system.
   */
  void validate() const;
};

}  // namespace lmech_sim

#endif  // LMECH_SIM_DATATYPES_PHYSICAL_PARAMETERS_HPP
