#include "lerpable/core/math/types.hpp"
#include <cmath>
#include <stdexcept>

namespace lerpable::core {

AffineTransform AffineTransform::operator*(const AffineTransform& other) const {
  return affineFromMatrix3(matrix3FromAffine(*this) * matrix3FromAffine(other));
}

// Column-vector form (Eigen convention): | a c tx |
//                                        | b d ty |
//                                        | 0 0 1  |
Mat3 matrix3FromAffine(const AffineTransform& t) {
  Mat3 m;
  m << t.a, t.c, t.tx,
       t.b, t.d, t.ty,
       0.0, 0.0, 1.0;
  return m;
}

AffineTransform affineFromMatrix3(const Mat3& m) {
  // Expect a homogeneous 2D transform. We tolerate small numeric drift.
  if (std::abs(m(2, 0)) > 1e-9 || std::abs(m(2, 1)) > 1e-9 ||
      std::abs(m(2, 2) - 1.0) > 1e-9) {
    throw std::runtime_error("affineFromMatrix3: last row != [0 0 1]");
  }

  AffineTransform out;
  out.a = m(0, 0);
  out.b = m(1, 0);
  out.c = m(0, 1);
  out.d = m(1, 1);
  out.tx = m(0, 2);
  out.ty = m(1, 2);
  return out;
}

Eigen::Affine2d affine2dFromAffine(const AffineTransform& t) {
  Eigen::Affine2d out = Eigen::Affine2d::Identity();
  out.matrix() = matrix3FromAffine(t);
  return out;
}

AffineTransform affineFromAffine2d(const Eigen::Affine2d& t) {
  return affineFromMatrix3(t.matrix());
}

Transform3D transform3DFromAffine(const AffineTransform& t) {
  // Row-vector layout: translation lives in m41/m42.
  Transform3D out = Transform3D::Identity();
  out(0, 0) = t.a;
  out(0, 1) = t.b;
  out(1, 0) = t.c;
  out(1, 1) = t.d;
  out(3, 0) = t.tx;
  out(3, 1) = t.ty;
  return out;
}

}  // namespace lerpable::core
