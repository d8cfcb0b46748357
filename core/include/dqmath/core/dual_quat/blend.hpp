#pragma once
#include "dqmath/core/common/constants.hpp"
#include "dqmath/core/common/status.hpp"
#include "dqmath/core/dual_quat/dual_quat.hpp"

#include <vector>

namespace dqmath::core {

// Dual-quaternion linear blending (Kavan et al. 2007), as used for skinning:
//   sum_i w_i * s_i * q_i,  s_i = sign(q_0.real . q_i.real)
// The sign flip keeps every term in the hemisphere of the first transform so
// that q and -q (the same rigid motion) do not cancel out.
//
// Returns InvalidParameter when `out` is null, the inputs are empty or of
// different lengths, a weight is not finite, or the accumulated real part
// is (numerically) zero.
Status blendDualQuats(const std::vector<DualQuat>& transforms,
                      const std::vector<float>& weights,
                      DualQuat* out,
                      const Tolerances& tol = kDefaultTolerances);

// Same accumulation, decomposed with normalizeToRotationTranslation().
Status blendToRotationTranslation(const std::vector<DualQuat>& transforms,
                                  const std::vector<float>& weights,
                                  RotationTranslation* out,
                                  const Tolerances& tol = kDefaultTolerances);

}  // namespace dqmath::core
