#include "lerpable/core/vectorize.hpp"

#include "lerpable/core/common/constants.hpp"
#include "lerpable/core/common/logger.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace lerpable::core {

Status checkArity(int expected, const Vector& values, ArityMismatch* mismatch) {
  const int actual = static_cast<int>(values.size());
  if (actual == expected) {
    return Status::Success;
  }
  if (mismatch) {
    mismatch->expected = expected;
    mismatch->actual = actual;
  }
  log(LogLevel::Error, "interpolatedFrom: expected " + std::to_string(expected) +
                       " components, got " + std::to_string(actual));
  return Status::ArityMismatch;
}

int components(const Interpolatable& value) {
  return std::visit([](const auto& v) {
    using T = std::decay_t<decltype(v)>;
    return Vectorizer<T>::kComponents;
  }, value);
}

// Resizes `out` to the list and copies it in order.
static Status assign(Vector* out, std::initializer_list<Real> values) {
  if (!out) return Status::InvalidParameter;
  out->resize(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (const Real v : values) {
    (*out)(i++) = v;
  }
  return Status::Success;
}

// Truncates toward zero into an integer type, rejecting what it cannot hold.
template <typename Int>
static Status truncateInto(Real v, Int* out) {
  if (!std::isfinite(v)) {
    log(LogLevel::Error, "interpolatedFrom: non-finite integer component");
    return Status::InvalidParameter;
  }
  const Real t = std::trunc(v);
  // Both bounds are powers of two and therefore exact as Real.
  const Real lo = static_cast<Real>(std::numeric_limits<Int>::min());
  const Real hi = -lo;
  if (t < lo || t >= hi) {
    log(LogLevel::Error, "interpolatedFrom: integer component out of range");
    return Status::InvalidParameter;
  }
  *out = static_cast<Int>(t);
  return Status::Success;
}

// --- Transform3D

Status Vectorizer<Transform3D>::encode(const Transform3D& value, Vector* out) {
  if (!out) return Status::InvalidParameter;
  out->resize(kComponents);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) {
      (*out)(r * 4 + c) = value(r, c);
    }
  }
  return Status::Success;
}

Status Vectorizer<Transform3D>::decode(const Vector& values, Transform3D* out) {
  if (!out) return Status::InvalidParameter;
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 4; ++c) {
      (*out)(r, c) = values(r * 4 + c);
    }
  }
  return Status::Success;
}

// --- AffineTransform

Status Vectorizer<AffineTransform>::encode(const AffineTransform& value, Vector* out) {
  return assign(out, {value.a, value.b, value.c, value.d, value.tx, value.ty});
}

Status Vectorizer<AffineTransform>::decode(const Vector& values, AffineTransform* out) {
  if (!out) return Status::InvalidParameter;
  out->a = values(0);
  out->b = values(1);
  out->c = values(2);
  out->d = values(3);
  out->tx = values(4);
  out->ty = values(5);
  return Status::Success;
}

// --- scalars

Status Vectorizer<Real>::encode(const Real& value, Vector* out) {
  return assign(out, {value});
}

Status Vectorizer<Real>::decode(const Vector& values, Real* out) {
  if (!out) return Status::InvalidParameter;
  *out = values(0);
  return Status::Success;
}

Status Vectorizer<float>::encode(const float& value, Vector* out) {
  return assign(out, {static_cast<Real>(value)});
}

Status Vectorizer<float>::decode(const Vector& values, float* out) {
  if (!out) return Status::InvalidParameter;
  *out = static_cast<float>(values(0));
  return Status::Success;
}

Status Vectorizer<int>::encode(const int& value, Vector* out) {
  return assign(out, {static_cast<Real>(value)});
}

Status Vectorizer<int>::decode(const Vector& values, int* out) {
  if (!out) return Status::InvalidParameter;
  return truncateInto(values(0), out);
}

static void notePrecisionLoss(std::int64_t value) {
  // Compared as integers; converting first would round 2^53 + 1 down to 2^53.
  const auto limit = static_cast<std::int64_t>(kDefaultTolerances.max_exact_integer);
  if ((value > limit || value < -limit) && shouldLog(LogLevel::Debug)) {
    log(LogLevel::Debug, "vectorize: integer " + std::to_string(value) +
                         " is not exactly representable");
  }
}

Status Vectorizer<std::int64_t>::encode(const std::int64_t& value, Vector* out) {
  notePrecisionLoss(value);
  return assign(out, {static_cast<Real>(value)});
}

Status Vectorizer<std::int64_t>::decode(const Vector& values, std::int64_t* out) {
  if (!out) return Status::InvalidParameter;
  return truncateInto(values(0), out);
}

Status Vectorizer<Number>::encode(const Number& value, Vector* out) {
  if (value.isInteger()) {
    notePrecisionLoss(value.toInt64());
  }
  return assign(out, {value.toReal()});
}

Status Vectorizer<Number>::decode(const Vector& values, Number* out) {
  if (!out) return Status::InvalidParameter;
  *out = Number(values(0));
  return Status::Success;
}

// --- geometry

Status Vectorizer<Point>::encode(const Point& value, Vector* out) {
  return assign(out, {value.x, value.y});
}

Status Vectorizer<Point>::decode(const Vector& values, Point* out) {
  if (!out) return Status::InvalidParameter;
  *out = Point{values(0), values(1)};
  return Status::Success;
}

Status Vectorizer<Rect>::encode(const Rect& value, Vector* out) {
  return assign(out, {value.origin.x, value.origin.y, value.size.width, value.size.height});
}

Status Vectorizer<Rect>::decode(const Vector& values, Rect* out) {
  if (!out) return Status::InvalidParameter;
  *out = Rect(values(0), values(1), values(2), values(3));
  return Status::Success;
}

Status Vectorizer<Size>::encode(const Size& value, Vector* out) {
  return assign(out, {value.width, value.height});
}

Status Vectorizer<Size>::decode(const Vector& values, Size* out) {
  if (!out) return Status::InvalidParameter;
  *out = Size{values(0), values(1)};
  return Status::Success;
}

Status Vectorizer<EdgeInsets>::encode(const EdgeInsets& value, Vector* out) {
  return assign(out, {value.top, value.left, value.bottom, value.right});
}

Status Vectorizer<EdgeInsets>::decode(const Vector& values, EdgeInsets* out) {
  if (!out) return Status::InvalidParameter;
  *out = EdgeInsets{values(0), values(1), values(2), values(3)};
  return Status::Success;
}

// --- Color

const char* colorModelToString(ColorModel model) {
  switch (model) {
    case ColorModel::Rgba: return "RGBA";
    case ColorModel::Grayscale: return "Grayscale";
    case ColorModel::Hsba: return "HSBA";
  }
  return "Unknown";
}

Status Vectorizer<Color>::selectModel(const Color& value, ColorModel* model) {
  if (!model) return Status::InvalidParameter;
  if (value.getRed(nullptr, nullptr, nullptr, nullptr)) {
    *model = ColorModel::Rgba;
    return Status::Success;
  }
  if (value.getWhite(nullptr, nullptr)) {
    *model = ColorModel::Grayscale;
    return Status::Success;
  }
  if (value.getHue(nullptr, nullptr, nullptr, nullptr)) {
    *model = ColorModel::Hsba;
    return Status::Success;
  }
  log(LogLevel::Warn, std::string("vectorize: unsupported color space ") +
                      colorSpaceToString(value.space()) + ", cannot interpolate");
  return Status::UnsupportedColorSpace;
}

Status Vectorizer<Color>::encode(const Color& value, Vector* out, ColorModel* model) {
  if (!out || !model) return Status::InvalidParameter;
  const Status st = selectModel(value, model);
  if (!ok(st)) return st;

  Real c0 = 0.0, c1 = 0.0, c2 = 0.0, alpha = 0.0;
  switch (*model) {
    case ColorModel::Rgba:
      value.getRed(&c0, &c1, &c2, &alpha);
      return assign(out, {c0, c1, c2, alpha});
    case ColorModel::Grayscale:
      value.getWhite(&c0, &alpha);
      return assign(out, {c0, alpha, 0.0, 0.0});
    case ColorModel::Hsba:
      value.getHue(&c0, &c1, &c2, &alpha);
      return assign(out, {c0, c1, c2, alpha});
  }
  return Status::Failure;
}

Status Vectorizer<Color>::decode(const Vector& values, Color* out) {
  return decode(values, ColorModel::Rgba, out);
}

Status Vectorizer<Color>::decode(const Vector& values, ColorModel model, Color* out) {
  if (!out) return Status::InvalidParameter;
  switch (model) {
    case ColorModel::Rgba:
      *out = Color::rgba(values(0), values(1), values(2), values(3));
      return Status::Success;
    case ColorModel::Grayscale:
      *out = Color::white(values(0), values(1));
      return Status::Success;
    case ColorModel::Hsba:
      *out = Color::hsba(values(0), values(1), values(2), values(3));
      return Status::Success;
  }
  return Status::Failure;
}

Status vectorize(const Color& value, NumericVector* out) {
  if (!out) return Status::InvalidParameter;
  Vector values;
  ColorModel model = ColorModel::Rgba;
  const Status st = Vectorizer<Color>::encode(value, &values, &model);
  if (!ok(st)) return st;

  auto reconstruct = [model](const Vector& v, Interpolatable* dst, ArityMismatch* mismatch) {
    if (!dst) return Status::InvalidParameter;
    const Status ast = checkArity(Vectorizer<Color>::kComponents, v, mismatch);
    if (!ok(ast)) return ast;
    Color color;
    const Status dst_st = Vectorizer<Color>::decode(v, model, &color);
    if (!ok(dst_st)) return dst_st;
    dst->emplace<Color>(color);
    return Status::Success;
  };
  *out = NumericVector(std::move(values), reconstruct);
  return Status::Success;
}

Status vectorize(const Interpolatable& value, NumericVector* out) {
  return std::visit([out](const auto& v) { return vectorize(v, out); }, value);
}

}  // namespace lerpable::core
