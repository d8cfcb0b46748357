#pragma once
#include "dqmath/core/math/types.hpp"

namespace dqmath::core {

// Rotation construction. `axis` is normalized internally.
Quat quatFromAxisAngle(const Vec3& axis, float angle);
Quat quatFromRotationX(float angle);
Quat quatFromRotationY(float angle);
Quat quatFromRotationZ(float angle);

// Axis-angle of a rotation, angle in [0, pi]. A (near) identity rotation
// yields axis +X and angle 0.
void quatToAxisAngle(const Quat& q, Vec3* axis, float* angle);

// Component-wise |a - b| <= max_abs_diff over x, y, z, w. Sign sensitive.
bool quatAbsDiffEq(const Quat& a, const Quat& b, float max_abs_diff);

// Chordal quaternion distance min(||q1 - q2||, ||q1 + q2||); insensitive to
// the double cover.
float rotationDistance(const Quat& q1, const Quat& q2);

}  // namespace dqmath::core
