// Ticket: 0005_trajectory_post_processing

#ifndef LMECH_SIM_ENVIRONMENT_ANGLE_HPP
#define LMECH_SIM_ENVIRONMENT_ANGLE_HPP

#include <cmath>
#include <numbers>

namespace lmech_sim
{

static constexpr double TWO_PI = 2.0 * std::numbers::pi;

/**
 * @brief Planar angle stored unwrapped, read back in (-pi, pi].
 *
 * Integration accumulates joint angles without bound; the normalization is
 * applied only when the value is read.
 */
class Angle
{
public:
  Angle() = default;

  explicit Angle(double radians) : rad_{radians}
  {
  }

  static Angle fromRadians(double radians)
  {
    return Angle{radians};
  }

  /**
   * Get the normalized angle in radians
   */
  [[nodiscard]] double getRad() const
  {
    return normalize();
  }

private:
  double rad_{0.0};

  double normalize() const
  {
    if (rad_ <= std::numbers::pi && rad_ > -std::numbers::pi)
    {
      return rad_;
    }

    // Half-open on the left: -pi maps to +pi
    double normAngle = std::fmod(rad_ - std::numbers::pi, TWO_PI);
    if (normAngle > 0.0)
    {
      normAngle -= TWO_PI;
    }
    normAngle += std::numbers::pi;
    if (normAngle <= -std::numbers::pi)
    {
      normAngle = std::numbers::pi;
    }
    return normAngle;
  }
};

/**
 * @brief Reduce an angle to its principal value in (-pi, pi]
 *
 * Idempotent, and invariant under whole turns: principalValue(a + 2πk) ==
 * principalValue(a) up to the rounding of the shifted input.
 */
inline double principalValue(double radians)
{
  return Angle::fromRadians(radians).getRad();
}

}  // namespace lmech_sim

#endif  // LMECH_SIM_ENVIRONMENT_ANGLE_HPP
