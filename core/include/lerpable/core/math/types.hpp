#pragma once
#include "lerpable/core/export.hpp"
#include <Eigen/Core>
#include <Eigen/Geometry>

#include <algorithm>

namespace lerpable::core {

// Plain graphics value types shared across the library.
// - `Real` is the common encoding scalar; every interpolatable type maps to a
//   fixed-length sequence of Reals.
// - Coordinates follow a y-down screen convention but nothing here depends on it.
// - `Transform3D` entry mRC is `T(R-1, C-1)` (row R, column C), matching the
//   m11..m44 naming of platform 3D layer transforms.
using Real = double;
using Vector = Eigen::VectorXd;

using Vec2 = Eigen::Vector2d;
using Mat3 = Eigen::Matrix3d;
using Mat4 = Eigen::Matrix4d;

using Transform3D = Mat4;

// 2D affine transform in the row-vector convention:
//   [x' y' 1] = [x y 1] * | a  b  0 |
//                         | c  d  0 |
//                         | tx ty 1 |
struct LERPABLE_CORE_API AffineTransform {
  Real a = 1.0;
  Real b = 0.0;
  Real c = 0.0;
  Real d = 1.0;
  Real tx = 0.0;
  Real ty = 0.0;

  static AffineTransform Identity() { return AffineTransform(); }

  Vec2 apply(const Vec2& p) const {
    return Vec2(a * p.x() + c * p.y() + tx, b * p.x() + d * p.y() + ty);
  }

  // Applies `other` first, then this transform.
  AffineTransform operator*(const AffineTransform& other) const;
};

struct Point {
  Real x = 0.0;
  Real y = 0.0;
};

struct Size {
  Real width = 0.0;
  Real height = 0.0;
};

struct Rect {
  Point origin;
  Size size;

  Rect() = default;
  Rect(Real x, Real y, Real w, Real h) : origin{x, y}, size{w, h} {}

  Real minX() const { return std::min(origin.x, origin.x + size.width); }
  Real minY() const { return std::min(origin.y, origin.y + size.height); }
  Real maxX() const { return std::max(origin.x, origin.x + size.width); }
  Real maxY() const { return std::max(origin.y, origin.y + size.height); }
  bool isEmpty() const { return size.width == 0.0 || size.height == 0.0; }
};

struct EdgeInsets {
  Real top = 0.0;
  Real left = 0.0;
  Real bottom = 0.0;
  Real right = 0.0;

  // Shrinks `r` by the insets; negative insets grow it.
  Rect inset(const Rect& r) const {
    return Rect(r.origin.x + left, r.origin.y + top,
                r.size.width - left - right, r.size.height - top - bottom);
  }
};

LERPABLE_CORE_API Mat3 matrix3FromAffine(const AffineTransform& t);
LERPABLE_CORE_API AffineTransform affineFromMatrix3(const Mat3& m);

LERPABLE_CORE_API Eigen::Affine2d affine2dFromAffine(const AffineTransform& t);
LERPABLE_CORE_API AffineTransform affineFromAffine2d(const Eigen::Affine2d& t);

// Embeds a 2D affine transform into a Transform3D acting on the xy plane.
LERPABLE_CORE_API Transform3D transform3DFromAffine(const AffineTransform& t);

}  // namespace lerpable::core
