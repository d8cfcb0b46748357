// Dual quaternion arithmetic.
// References:
// - Kavan, Collins, Zara, O'Sullivan, "Skinning with Dual Quaternions" (2007)
// - Kenwright, "A Beginners Guide to Dual-Quaternions" (WSCG 2012)
#include "dqmath/core/dual_quat/dual_quat.hpp"

#include "dqmath/core/common/debug_check.hpp"
#include "dqmath/core/math/so3.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace dqmath::core {

static inline float quatDot(const Quat& a, const Quat& b) {
  return a.coeffs().dot(b.coeffs());
}

static inline Quat quatAdd(const Quat& a, const Quat& b) {
  return quatFromCoeffs(a.coeffs() + b.coeffs());
}

static inline Quat quatSub(const Quat& a, const Quat& b) {
  return quatFromCoeffs(a.coeffs() - b.coeffs());
}

static inline Quat quatScale(const Quat& q, float k) {
  return quatFromCoeffs(q.coeffs() * k);
}

DualQuat DualQuat::identity() { return DualQuat(); }

DualQuat DualQuat::zero() { return DualQuat(zeroQuat(), zeroQuat()); }

DualQuat DualQuat::fromRotationTranslation(const Quat& rotation, const Vec3& translation) {
  // dual = 0.5 * t_quat * r
  return DualQuat(rotation, pureQuat(translation * 0.5f) * rotation);
}

DualQuat DualQuat::fromTranslation(const Vec3& translation) {
  return DualQuat(Quat::Identity(), pureQuat(translation * 0.5f));
}

DualQuat DualQuat::fromQuat(const Quat& rotation) {
  return DualQuat(rotation, zeroQuat());
}

DualQuat DualQuat::fromIsoTransform(const Transform& T) {
  return fromRotationTranslation(Quat(T.rotation()), T.translation());
}

RotationTranslation DualQuat::toRotationTranslation() const {
  // t_quat = 2 * (dual * real*)
  const Quat t_quat = dual * real.conjugate();
  RotationTranslation out;
  out.rotation = real;
  out.translation = 2.0f * t_quat.vec();
  return out;
}

Transform DualQuat::toTransform() const {
  const RotationTranslation rt = toRotationTranslation();
  Transform T = Transform::Identity();
  T.linear() = rt.rotation.toRotationMatrix();
  T.translation() = rt.translation;
  return T;
}

RotationTranslation DualQuat::normalizeToRotationTranslation() const {
  // Scaling both parts by 1/|real| makes `real` unit. The dual part is then
  // still off by a multiple of `real`, which only touches the w component of
  // dual * real* and drops out of the translation.
  const float real_norm_inv = 1.0f / real.norm();
  const DualQuat scaled(quatScale(real, real_norm_inv), quatScale(dual, real_norm_inv));
  return scaled.toRotationTranslation();
}

DualQuat DualQuat::conjugate() const {
  return DualQuat(real.conjugate(), dual.conjugate());
}

DualQuat DualQuat::inverse() const {
  DQMATH_DEBUG_CHECK(isNormalized(), "DualQuat::inverse: dual quaternion is not unit");
  return conjugate();
}

DualScalar DualQuat::normSquared() const {
  // q q* expands to |real|^2 + eps 2 (real . dual)
  return DualScalar{real.squaredNorm(), 2.0f * quatDot(real, dual)};
}

DualScalar DualQuat::norm() const {
  const float real_norm = real.norm();
  return DualScalar{real_norm, quatDot(real, dual) / real_norm};
}

bool DualQuat::isNormalized(float eps) const {
  const DualScalar norm_sq = normSquared();
  return std::abs(norm_sq.real - 1.0f) < eps && std::abs(norm_sq.dual) < eps;
}

DualQuat DualQuat::normalizeFull() const {
  // norm           = (|r|, (r.d) / |r|)
  // inverse(a, b)  = (1 / a, -b / a^2)
  // => normalizer  = (1 / |r|, -(r.d) / (|r| |r|^2))
  const float real_normsq = real.squaredNorm();
  const float real_norm = std::sqrt(real_normsq);
  const float dot = quatDot(real, dual);

  const DualScalar normalizer{1.0f / real_norm, -dot / (real_norm * real_normsq)};
  return normalizer * *this;
}

bool DualQuat::absDiffEq(const DualQuat& other, float max_abs_diff) const {
  return quatAbsDiffEq(real, other.real, max_abs_diff) &&
         quatAbsDiffEq(dual, other.dual, max_abs_diff);
}

DualQuat DualQuat::rightMulTranslation(const Vec3& t) const {
  // dual += 0.5 * real * (t, 0), expanded.
  DualQuat out = *this;
  const Quat& r = real;
  out.dual.w() -= 0.5f * (r.x() * t.x() + r.y() * t.y() + r.z() * t.z());
  out.dual.x() += 0.5f * (r.w() * t.x() + r.y() * t.z() - r.z() * t.y());
  out.dual.y() += 0.5f * (r.w() * t.y() + r.z() * t.x() - r.x() * t.z());
  out.dual.z() += 0.5f * (r.w() * t.z() + r.x() * t.y() - r.y() * t.x());
  return out;
}

DualQuat DualQuat::pow(float t) const {
  // q and -q are the same transform; pick w >= 0 so the angle is in [0, pi].
  DualQuat dq = *this;
  if (dq.real.w() < 0.0f) {
    dq.real.coeffs() *= -1.0f;
    dq.dual.coeffs() *= -1.0f;
  }

  const Vec3 p = dq.toRotationTranslation().translation;
  const Vec3 axis_raw = dq.real.vec();
  const float s = axis_raw.norm();
  const float theta = 2.0f * std::atan2(s, dq.real.w());

  if (theta < kDefaultTolerances.small_angle_eps) {
    // Pure translation: the screw degenerates to a straight line.
    return DualQuat::fromTranslation(t * p);
  }

  const Vec3 u = axis_raw / s;
  const float d = p.dot(u);                                  // pitch * angle
  const Vec3 m = 0.5f * (p.cross(u) + (p - d * u) / std::tan(0.5f * theta));  // moment

  const float half = 0.5f * t * theta;
  const float c = std::cos(half);
  const float sn = std::sin(half);
  const float td = 0.5f * t * d;

  DualQuat out;
  out.real.w() = c;
  out.real.vec() = sn * u;
  out.dual.w() = -td * sn;
  out.dual.vec() = sn * m + td * c * u;
  return out;
}

DualQuat& DualQuat::operator+=(const DualQuat& rhs) {
  real.coeffs() += rhs.real.coeffs();
  dual.coeffs() += rhs.dual.coeffs();
  return *this;
}

DualQuat& DualQuat::operator-=(const DualQuat& rhs) {
  real.coeffs() -= rhs.real.coeffs();
  dual.coeffs() -= rhs.dual.coeffs();
  return *this;
}

DualQuat operator*(const DualQuat& a, const DualQuat& b) {
  const Quat real = a.real * b.real;
  const Quat dual = quatAdd(a.real * b.dual, a.dual * b.real);
  return DualQuat(real, dual);
}

DualQuat operator+(const DualQuat& a, const DualQuat& b) {
  return DualQuat(quatAdd(a.real, b.real), quatAdd(a.dual, b.dual));
}

DualQuat operator-(const DualQuat& a, const DualQuat& b) {
  return DualQuat(quatSub(a.real, b.real), quatSub(a.dual, b.dual));
}

DualQuat operator*(const DualQuat& q, float k) {
  return DualQuat(quatScale(q.real, k), quatScale(q.dual, k));
}

DualQuat operator*(float k, const DualQuat& q) {
  return q * k;
}

DualQuat operator*(const DualScalar& s, const DualQuat& q) {
  return DualQuat(quatScale(q.real, s.real),
                  quatAdd(quatScale(q.dual, s.real), quatScale(q.real, s.dual)));
}

DualQuat operator*(const DualQuat& q, const DualScalar& s) {
  return s * q;
}

DualQuat sclerp(const DualQuat& a, const DualQuat& b, float t) {
  const DualQuat a_norm = a.normalizeFull();
  const DualQuat b_norm = b.normalizeFull();
  // pow() canonicalizes the sign of the relative motion, which selects the
  // shorter arc.
  const DualQuat rel = a_norm.conjugate() * b_norm;
  return a_norm * rel.pow(t);
}

std::ostream& operator<<(std::ostream& os, const DualQuat& q) {
  const RotationTranslation rt = q.toRotationTranslation();
  Vec3 axis;
  float angle = 0.0f;
  quatToAxisAngle(rt.rotation, &axis, &angle);

  std::ostringstream degrees;
  degrees << std::fixed << std::setprecision(1)
          << angle * (180.0f / static_cast<float>(M_PI));

  const Vec3& t = rt.translation;
  const Vec4& r = q.real.coeffs();
  const Vec4& d = q.dual.coeffs();
  os << "DualQuat { translation: [" << t.x() << " " << t.y() << " " << t.z() << "]"
     << ", rotation: " << degrees.str() << " deg around ["
     << axis.x() << " " << axis.y() << " " << axis.z() << "]"
     << ", real(raw): [" << r.x() << " " << r.y() << " " << r.z() << " " << r.w() << "]"
     << ", dual(raw): [" << d.x() << " " << d.y() << " " << d.z() << " " << d.w() << "] }";
  return os;
}

std::string toString(const DualQuat& q) {
  std::ostringstream ss;
  ss << q;
  return ss.str();
}

}  // namespace dqmath::core
