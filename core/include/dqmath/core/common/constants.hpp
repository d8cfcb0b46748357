#pragma once

namespace dqmath::core {

// Numerical tolerances shared by the dual-quaternion code.
struct Tolerances {
  // |normSquared.real - 1| and |normSquared.dual| must both be below this
  // for a dual quaternion to count as unit.
  float normalized_eps = 1.0e-4f;

  // Squared length of a real part below which normalization is refused by
  // the blending helpers.
  float zero_norm_eps = 1.0e-12f;

  // Rotation angle (rad) below which a screw motion is treated as a pure
  // translation.
  float small_angle_eps = 1.0e-6f;
};

inline constexpr Tolerances kDefaultTolerances{};

}  // namespace dqmath::core
