#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

#include "dqmath/core/common/logger.hpp"
#include "dqmath/core/common/status.hpp"
#include "dqmath/core/dual_quat/blend.hpp"
#include "dqmath/core/math/so3.hpp"

using dqmath::core::DualQuat;
using dqmath::core::Quat;
using dqmath::core::RotationTranslation;
using dqmath::core::Status;
using dqmath::core::Vec3;
using dqmath::core::blendDualQuats;
using dqmath::core::blendToRotationTranslation;
using dqmath::core::ok;
using dqmath::core::quatFromRotationZ;

static bool vecNear(const Vec3& a, const Vec3& b, float tol) {
  return (a - b).cwiseAbs().maxCoeff() <= tol;
}

static void quietSink(dqmath::core::LogLevel, const std::string&) {}

static void test_single_and_equal() {
  const DualQuat q = DualQuat::fromRotationTranslation(quatFromRotationZ(0.6f),
                                                       Vec3(1.0f, -2.0f, 0.5f));
  DualQuat out;
  assert(ok(blendDualQuats({q}, {0.3f}, &out)));
  assert(out.absDiffEq(q, 1e-6f));

  assert(ok(blendDualQuats({q, q, q}, {0.2f, 0.5f, 0.3f}, &out)));
  assert(out.absDiffEq(q, 1e-6f));
}

static void test_two_bone_blend() {
  // Two rotations about Z through the origin: a 50/50 blend is the halfway
  // rotation, with no shrinking of points (unlike linear blend skinning).
  const DualQuat a = DualQuat::fromQuat(quatFromRotationZ(0.0f));
  const DualQuat b = DualQuat::fromQuat(quatFromRotationZ(1.2f));

  DualQuat out;
  assert(ok(blendDualQuats({a, b}, {0.5f, 0.5f}, &out)));
  assert(out.isNormalized());

  const RotationTranslation rt = out.toRotationTranslation();
  assert(dqmath::core::rotationDistance(rt.rotation, quatFromRotationZ(0.6f)) <= 1e-5f);

  const Vec3 p(2.0f, 0.0f, 0.0f);
  const Vec3 moved = rt.transformPoint(p);
  assert(std::abs(moved.norm() - 2.0f) <= 1e-5f);

  RotationTranslation fast;
  assert(ok(blendToRotationTranslation({a, b}, {0.5f, 0.5f}, &fast)));
  assert(vecNear(fast.transformPoint(p), moved, 1e-5f));
}

static void test_hemisphere_alignment() {
  // -q is the same transform as q; it must not cancel q out.
  const DualQuat q = DualQuat::fromRotationTranslation(quatFromRotationZ(0.9f),
                                                       Vec3(0.0f, 3.0f, 0.0f));
  const DualQuat neg = q * -1.0f;

  DualQuat out;
  assert(ok(blendDualQuats({q, neg}, {0.5f, 0.5f}, &out)));
  const RotationTranslation rt = out.toRotationTranslation();
  const RotationTranslation expect = q.toRotationTranslation();
  assert(dqmath::core::rotationDistance(rt.rotation, expect.rotation) <= 1e-5f);
  assert(vecNear(rt.translation, expect.translation, 1e-5f));
}

static void test_translation_blend() {
  const DualQuat a = DualQuat::fromTranslation(Vec3(0.0f, 0.0f, 0.0f));
  const DualQuat b = DualQuat::fromTranslation(Vec3(4.0f, 0.0f, -2.0f));

  RotationTranslation rt;
  assert(ok(blendToRotationTranslation({a, b}, {0.75f, 0.25f}, &rt)));
  assert(vecNear(rt.translation, Vec3(1.0f, 0.0f, -0.5f), 1e-6f));

  // Zero weights are skipped.
  assert(ok(blendToRotationTranslation({a, b}, {0.0f, 1.0f}, &rt)));
  assert(vecNear(rt.translation, Vec3(4.0f, 0.0f, -2.0f), 1e-6f));
}

static void test_invalid_inputs() {
  dqmath::core::setLogSink(&quietSink);

  const DualQuat q = DualQuat::identity();
  DualQuat out;
  RotationTranslation rt;

  assert(blendDualQuats({q}, {1.0f}, nullptr) == Status::InvalidParameter);
  assert(blendToRotationTranslation({q}, {1.0f}, nullptr) == Status::InvalidParameter);
  assert(blendDualQuats({}, {}, &out) == Status::InvalidParameter);
  assert(blendDualQuats({q, q}, {1.0f}, &out) == Status::InvalidParameter);
  assert(blendDualQuats({q}, {std::numeric_limits<float>::quiet_NaN()}, &out) ==
         Status::InvalidParameter);
  assert(blendDualQuats({q, q}, {0.0f, 0.0f}, &out) == Status::InvalidParameter);
  assert(blendToRotationTranslation({q}, {0.0f}, &rt) == Status::InvalidParameter);

  dqmath::core::setLogSink(nullptr);
}

int main() {
  test_single_and_equal();
  test_two_bone_blend();
  test_hemisphere_alignment();
  test_translation_blend();
  test_invalid_inputs();
  std::cout << "dqmath_blend_test: PASS\n";
  return 0;
}
