#pragma once
#include "dqmath/core/math/types.hpp"

namespace dqmath::core {

// Coordinate system: right-handed, +X = right, +Y = up, -Z = forward,
// +Z = back.
inline Vec3 up() { return Vec3(0.0f, 1.0f, 0.0f); }
inline Vec3 down() { return Vec3(0.0f, -1.0f, 0.0f); }
inline Vec3 right() { return Vec3(1.0f, 0.0f, 0.0f); }
inline Vec3 left() { return Vec3(-1.0f, 0.0f, 0.0f); }
inline Vec3 forward() { return Vec3(0.0f, 0.0f, -1.0f); }
inline Vec3 back() { return Vec3(0.0f, 0.0f, 1.0f); }

// Per-component helpers Eigen does not provide directly.
Vec3 truncVec(const Vec3& v);
Vec3 fractVec(const Vec3& v);       // v - trunc(v), keeps the sign of v
Vec3 saturate(const Vec3& v);       // clamp to [0, 1]

// GLSL step(edge, x): 0 where value[i] < edge[i], 1 otherwise.
Vec3 stepVec(const Vec3& edge, const Vec3& value);

// Reflection of incident vector `v` about surface normal `normal`.
Vec3 reflect(const Vec3& v, const Vec3& normal);

float mean(const Vec3& v);
bool hasEqualComponents(const Vec3& v, float max_abs_diff);

// M * diag(scale), without building the diagonal matrix.
Mat3 mulDiagonalScale(const Mat3& m, const Vec3& scale);

}  // namespace dqmath::core
