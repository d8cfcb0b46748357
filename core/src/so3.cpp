// SO(3) helpers on unit quaternions.
// - `quatToAxisAngle` uses atan2 of the vector norm and w, which stays
//   accurate for small angles where acos(w) loses precision in float.
// - `rotationDistance(q1,q2)` is the quaternion chordal distance:
//     min(||q1 - q2||, ||q1 + q2||)
//   (useful for convergence checks; not the rotation angle in radians).
#include "dqmath/core/math/so3.hpp"
#include <cmath>

namespace dqmath::core {

Quat quatFromAxisAngle(const Vec3& axis, float angle) {
  return Quat(Eigen::AngleAxisf(angle, axis.normalized()));
}

Quat quatFromRotationX(float angle) {
  return Quat(Eigen::AngleAxisf(angle, Vec3::UnitX()));
}

Quat quatFromRotationY(float angle) {
  return Quat(Eigen::AngleAxisf(angle, Vec3::UnitY()));
}

Quat quatFromRotationZ(float angle) {
  return Quat(Eigen::AngleAxisf(angle, Vec3::UnitZ()));
}

void quatToAxisAngle(const Quat& q, Vec3* axis, float* angle) {
  Quat n = q.normalized();
  // Same rotation, angle kept in [0, pi]
  if (n.w() < 0.0f) n.coeffs() *= -1.0f;

  const float s = n.vec().norm();
  if (s < 1e-12f) {
    if (axis) *axis = Vec3::UnitX();
    if (angle) *angle = 0.0f;
    return;
  }
  if (axis) *axis = n.vec() / s;
  if (angle) *angle = 2.0f * std::atan2(s, n.w());
}

bool quatAbsDiffEq(const Quat& a, const Quat& b, float max_abs_diff) {
  return (a.coeffs() - b.coeffs()).cwiseAbs().maxCoeff() <= max_abs_diff;
}

float rotationDistance(const Quat& q1, const Quat& q2) {
  const Quat a = q1.normalized();
  const Quat b = q2.normalized();

  const Vec4 v1 = a.coeffs();
  const Vec4 v2 = b.coeffs();
  const float d1 = (v1 - v2).norm();
  const float d2 = (v1 + v2).norm();
  return (d1 > d2) ? d2 : d1;
}

}  // namespace dqmath::core
