#include "dqmath/core/dual_quat/blend.hpp"

#include "dqmath/core/common/logger.hpp"

#include <cmath>

namespace dqmath::core {

static Status accumulateBlend(const std::vector<DualQuat>& transforms,
                              const std::vector<float>& weights,
                              const Tolerances& tol,
                              DualQuat* sum) {
  if (transforms.empty()) {
    log(LogLevel::Error, "blendDualQuats: no transforms to blend");
    return Status::InvalidParameter;
  }
  if (transforms.size() != weights.size()) {
    log(LogLevel::Error, "blendDualQuats: transforms and weights differ in length");
    return Status::InvalidParameter;
  }

  const Quat& pivot = transforms.front().real;
  DualQuat acc = DualQuat::zero();
  for (std::size_t i = 0; i < transforms.size(); ++i) {
    const float w = weights[i];
    if (!std::isfinite(w)) {
      log(LogLevel::Error, "blendDualQuats: NaN/Inf weight");
      return Status::InvalidParameter;
    }
    if (w == 0.0f) continue;

    const DualQuat& q = transforms[i];
    const float sign = (pivot.coeffs().dot(q.real.coeffs()) < 0.0f) ? -1.0f : 1.0f;
    acc += q * (sign * w);
  }

  if (!(acc.real.squaredNorm() > tol.zero_norm_eps)) {
    log(LogLevel::Error, "blendDualQuats: blended real part has zero norm");
    return Status::InvalidParameter;
  }

  *sum = acc;
  return Status::Success;
}

Status blendDualQuats(const std::vector<DualQuat>& transforms,
                      const std::vector<float>& weights,
                      DualQuat* out,
                      const Tolerances& tol) {
  if (!out) return Status::InvalidParameter;

  DualQuat sum = DualQuat::zero();
  const Status st = accumulateBlend(transforms, weights, tol, &sum);
  if (!ok(st)) return st;

  *out = sum.normalizeFull();
  return Status::Success;
}

Status blendToRotationTranslation(const std::vector<DualQuat>& transforms,
                                  const std::vector<float>& weights,
                                  RotationTranslation* out,
                                  const Tolerances& tol) {
  if (!out) return Status::InvalidParameter;

  DualQuat sum = DualQuat::zero();
  const Status st = accumulateBlend(transforms, weights, tol, &sum);
  if (!ok(st)) return st;

  *out = sum.normalizeToRotationTranslation();
  return Status::Success;
}

}  // namespace dqmath::core
