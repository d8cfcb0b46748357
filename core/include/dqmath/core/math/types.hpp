#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace dqmath::core {

// Fundamental math types and conventions used across the library.
// - Single precision throughout; layouts match what a GPU shader expects.
// - `Transform` is a rigid transform composed by left-multiplication
//   (A * B applies B, then A).
// - Quaternion coefficients are stored x, y, z, w (Eigen's `coeffs()` order).
using Vec3 = Eigen::Vector3f;
using Vec4 = Eigen::Vector4f;
using Mat3 = Eigen::Matrix3f;
using Mat4 = Eigen::Matrix4f;
using Quat = Eigen::Quaternionf;

using Transform = Eigen::Isometry3f;

inline Quat quatFromCoeffs(const Vec4& xyzw) {
  Quat q;
  q.coeffs() = xyzw;
  return q;
}

// Translation embedded as a pure quaternion (x, y, z, 0).
inline Quat pureQuat(const Vec3& v) {
  return Quat(0.0f, v.x(), v.y(), v.z());
}

inline Quat zeroQuat() {
  return Quat(0.0f, 0.0f, 0.0f, 0.0f);
}

}  // namespace dqmath::core
