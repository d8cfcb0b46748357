#pragma once
#include "dqmath/core/common/constants.hpp"
#include "dqmath/core/dual_quat/dual_scalar.hpp"
#include "dqmath/core/math/types.hpp"

#include <iosfwd>
#include <string>

namespace dqmath::core {

// Decomposed rigid transform. Apply to a point as `rotation * p + translation`.
struct RotationTranslation {
  Quat rotation{Quat::Identity()};
  Vec3 translation{Vec3::Zero()};

  Vec3 transformPoint(const Vec3& p) const { return rotation * p + translation; }
};

// Dual quaternion representation of a rigid transform:
//   dq = real + eps * dual, rotation in `real`, translation encoded in `dual`
//   relative to `real` (dual = 0.5 * t * real).
//
// Transforms the same way a rotation + translation pair does, but blends and
// interpolates without the volume loss of matrix/linear blending. A weighted
// sum of dual quaternions is not unit and must go through normalizeFull() or
// normalizeToRotationTranslation() before it is used as a transform.
//
// Layout is two consecutive xyzw float quaternions, 32 bytes, 16-byte
// aligned, so arrays of DualQuat can be copied into GPU buffers as is.
struct alignas(16) DualQuat {
  Quat real{Quat::Identity()};
  Quat dual{zeroQuat()};

  DualQuat() = default;                   // identity
  DualQuat(const Quat& real_part, const Quat& dual_part)
    : real(real_part), dual(dual_part) {}

  static DualQuat identity();
  // Not a transform; seed for weighted accumulation.
  static DualQuat zero();

  // Rotates, then translates. `rotation` is assumed to be unit.
  static DualQuat fromRotationTranslation(const Quat& rotation, const Vec3& translation);
  static DualQuat fromTranslation(const Vec3& translation);
  static DualQuat fromQuat(const Quat& rotation);
  static DualQuat fromIsoTransform(const Transform& T);

  // Assumes `*this` is unit. Otherwise use normalizeToRotationTranslation().
  RotationTranslation toRotationTranslation() const;
  Transform toTransform() const;

  // Cheaper than normalizeFull().toRotationTranslation(): only `real` is
  // rescaled, the translation extraction cancels the remaining terms
  // (Kavan et al. 2007, eq. 4 and section 3.4).
  RotationTranslation normalizeToRotationTranslation() const;

  // (real*, dual*). Equals the inverse when `*this` is unit.
  DualQuat conjugate() const;

  // Valid only for unit dual quaternions; debug-checked.
  DualQuat inverse() const;

  // (|real|^2, 2 real.dual); unit iff (1, 0).
  DualScalar normSquared() const;
  // (|real|, real.dual / |real|). Requires real != 0.
  DualScalar norm() const;
  bool isNormalized(float eps = kDefaultTolerances.normalized_eps) const;

  // Multiplies by the inverse norm, computed in one step.
  DualQuat normalizeFull() const;

  bool absDiffEq(const DualQuat& other, float max_abs_diff) const;

  // Same as `*this * DualQuat::fromTranslation(t)` (translation applied
  // first), updating only the dual part.
  DualQuat rightMulTranslation(const Vec3& t) const;

  // Screw-motion power of a unit dual quaternion: rotation angle and
  // translation along the screw axis both scale by `t`.
  DualQuat pow(float t) const;

  DualQuat& operator+=(const DualQuat& rhs);
  DualQuat& operator-=(const DualQuat& rhs);
};

static_assert(sizeof(DualQuat) == 32, "DualQuat must be two packed float quaternions");
static_assert(alignof(DualQuat) == 16, "DualQuat must be 16-byte aligned");

// (r1 + eps d1)(r2 + eps d2) = r1 r2 + eps (r1 d2 + d1 r2); applies `b`, then `a`.
DualQuat operator*(const DualQuat& a, const DualQuat& b);
DualQuat operator+(const DualQuat& a, const DualQuat& b);
DualQuat operator-(const DualQuat& a, const DualQuat& b);
DualQuat operator*(const DualQuat& q, float k);
DualQuat operator*(float k, const DualQuat& q);

// Treats `q` as a quaternion with dual-number coefficients.
DualQuat operator*(const DualScalar& s, const DualQuat& q);
DualQuat operator*(const DualQuat& q, const DualScalar& s);

// Screw linear interpolation: a * (a^-1 b)^t, along the shorter arc.
DualQuat sclerp(const DualQuat& a, const DualQuat& b, float t);

// Human-readable: translation, axis-angle rotation in degrees and the raw parts.
std::ostream& operator<<(std::ostream& os, const DualQuat& q);
std::string toString(const DualQuat& q);

}  // namespace dqmath::core
