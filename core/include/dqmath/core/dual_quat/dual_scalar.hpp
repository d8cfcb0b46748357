#pragma once
#include <cmath>
#include <iosfwd>

namespace dqmath::core {

// Dual number real + eps * dual with eps^2 = 0.
//
// Norms of dual quaternions are dual numbers, so normalization needs the
// dual-number versions of sqrt and reciprocal. The dual part carries the
// first-order term: f(a + eps b) = f(a) + eps b f'(a).
struct DualScalar {
  float real{0.0f};
  float dual{0.0f};

  // Defined only for a positive real part; NaN otherwise.
  DualScalar sqrt() const {
    const float real_sqrt = std::sqrt(real);
    return DualScalar{real_sqrt, dual / (2.0f * real_sqrt)};
  }

  // Equivalent to sqrt().inverse() with a single square root and division.
  // Defined only for a positive, non-zero real part.
  DualScalar inverseSqrt() const {
    const float real_sqrt = std::sqrt(real);
    return DualScalar{1.0f / real_sqrt, -dual / (2.0f * real * real_sqrt)};
  }

  // x * x.inverse() == (1, 0). Requires real != 0.
  DualScalar inverse() const {
    const float real_inv = 1.0f / real;
    return DualScalar{real_inv, -dual * real_inv * real_inv};
  }

  bool absDiffEq(const DualScalar& other, float max_abs_diff) const {
    return std::abs(real - other.real) <= max_abs_diff &&
           std::abs(dual - other.dual) <= max_abs_diff;
  }
};

inline DualScalar operator+(const DualScalar& a, const DualScalar& b) {
  return DualScalar{a.real + b.real, a.dual + b.dual};
}

inline DualScalar operator-(const DualScalar& a, const DualScalar& b) {
  return DualScalar{a.real - b.real, a.dual - b.dual};
}

// (a + eps b)(c + eps d) = ac + eps (ad + bc)
inline DualScalar operator*(const DualScalar& a, const DualScalar& b) {
  return DualScalar{a.real * b.real, a.real * b.dual + a.dual * b.real};
}

inline DualScalar operator*(const DualScalar& a, float k) {
  return DualScalar{a.real * k, a.dual * k};
}

inline DualScalar operator*(float k, const DualScalar& a) {
  return a * k;
}

std::ostream& operator<<(std::ostream& os, const DualScalar& s);

}  // namespace dqmath::core
