#include "dqmath/core/math/vec3_ext.hpp"

#include <cmath>

namespace dqmath::core {

Vec3 truncVec(const Vec3& v) {
  return Vec3(std::trunc(v.x()), std::trunc(v.y()), std::trunc(v.z()));
}

Vec3 fractVec(const Vec3& v) {
  return v - truncVec(v);
}

Vec3 saturate(const Vec3& v) {
  return v.cwiseMax(0.0f).cwiseMin(1.0f);
}

Vec3 stepVec(const Vec3& edge, const Vec3& value) {
  Vec3 out;
  for (int i = 0; i < 3; ++i) {
    out(i) = value(i) < edge(i) ? 0.0f : 1.0f;
  }
  return out;
}

Vec3 reflect(const Vec3& v, const Vec3& normal) {
  return v - 2.0f * v.dot(normal) * normal;
}

float mean(const Vec3& v) {
  return v.sum() / 3.0f;
}

bool hasEqualComponents(const Vec3& v, float max_abs_diff) {
  return std::abs(v.x() - v.y()) < max_abs_diff &&
         std::abs(v.y() - v.z()) < max_abs_diff &&
         std::abs(v.x() - v.z()) < max_abs_diff;
}

Mat3 mulDiagonalScale(const Mat3& m, const Vec3& scale) {
  // Column i of M * diag(s) is s[i] * column i of M.
  Mat3 out = m;
  out.col(0) *= scale.x();
  out.col(1) *= scale.y();
  out.col(2) *= scale.z();
  return out;
}

}  // namespace dqmath::core
