#pragma once
#include "lerpable/core/export.hpp"
#include "lerpable/core/common/status.hpp"
#include "lerpable/core/interpolatable.hpp"
#include "lerpable/core/value/numeric_vector.hpp"

#include <cstdint>
#include <utility>
#include <variant>

namespace lerpable::core {

// Per-type numeric encoding.
//
// Each supported type specializes `Vectorizer<T>` with:
// - `kComponents`: fixed arity of the encoding.
// - `encode(value, &values)`: writes exactly kComponents values.
// - `decode(values, &value)`: reads exactly kComponents values. Callers go through
//   `interpolatedFrom<T>()`, which validates the length first.
// Field order is part of the contract (see each specialization). Color is the
// exception to the uniform shape: its encoding depends on a model chosen per
// value, so `vectorize(const Color&)` below replaces the generic path.
template <typename T>
struct Vectorizer;

// m11, m12, m13, m14, m21, ..., m44 (row-major).
template <>
struct LERPABLE_CORE_API Vectorizer<Transform3D> {
  static constexpr int kComponents = 16;
  static Status encode(const Transform3D& value, Vector* out);
  static Status decode(const Vector& values, Transform3D* out);
};

// a, b, c, d, tx, ty
template <>
struct LERPABLE_CORE_API Vectorizer<AffineTransform> {
  static constexpr int kComponents = 6;
  static Status encode(const AffineTransform& value, Vector* out);
  static Status decode(const Vector& values, AffineTransform* out);
};

template <>
struct LERPABLE_CORE_API Vectorizer<Real> {
  static constexpr int kComponents = 1;
  static Status encode(const Real& value, Vector* out);
  static Status decode(const Vector& values, Real* out);
};

template <>
struct LERPABLE_CORE_API Vectorizer<float> {
  static constexpr int kComponents = 1;
  static Status encode(const float& value, Vector* out);
  static Status decode(const Vector& values, float* out);
};

// Integers truncate toward zero on decode. Non-finite or out-of-range values
// fail with Status::InvalidParameter.
template <>
struct LERPABLE_CORE_API Vectorizer<int> {
  static constexpr int kComponents = 1;
  static Status encode(const int& value, Vector* out);
  static Status decode(const Vector& values, int* out);
};

template <>
struct LERPABLE_CORE_API Vectorizer<std::int64_t> {
  static constexpr int kComponents = 1;
  static Status encode(const std::int64_t& value, Vector* out);
  static Status decode(const Vector& values, std::int64_t* out);
};

// x, y
template <>
struct LERPABLE_CORE_API Vectorizer<Point> {
  static constexpr int kComponents = 2;
  static Status encode(const Point& value, Vector* out);
  static Status decode(const Vector& values, Point* out);
};

// origin.x, origin.y, size.width, size.height
template <>
struct LERPABLE_CORE_API Vectorizer<Rect> {
  static constexpr int kComponents = 4;
  static Status encode(const Rect& value, Vector* out);
  static Status decode(const Vector& values, Rect* out);
};

// width, height
template <>
struct LERPABLE_CORE_API Vectorizer<Size> {
  static constexpr int kComponents = 2;
  static Status encode(const Size& value, Vector* out);
  static Status decode(const Vector& values, Size* out);
};

// Decodes to a Real-kind number.
template <>
struct LERPABLE_CORE_API Vectorizer<Number> {
  static constexpr int kComponents = 1;
  static Status encode(const Number& value, Vector* out);
  static Status decode(const Vector& values, Number* out);
};

// Color encodings, tried in this order:
// - Rgba:      r, g, b, a        (native RGB colors)
// - Grayscale: white, a, 0, 0    (native grayscale colors; slots 2-3 are padding)
// - Hsba:      h, s, b, a        (native HSB colors)
// CMYK colors fit none of them and fail with Status::UnsupportedColorSpace.
enum class ColorModel : std::uint8_t {
  Rgba = 0,
  Grayscale = 1,
  Hsba = 2
};

LERPABLE_CORE_API const char* colorModelToString(ColorModel model);

template <>
struct LERPABLE_CORE_API Vectorizer<Color> {
  static constexpr int kComponents = 4;

  static Status selectModel(const Color& value, ColorModel* model);

  // Also reports the chosen model, which decoding needs.
  static Status encode(const Color& value, Vector* out, ColorModel* model);

  // Without a model the values are read as RGBA. Decoding a Grayscale encoding
  // this way gives a valid but visually wrong color.
  static Status decode(const Vector& values, Color* out);
  static Status decode(const Vector& values, ColorModel model, Color* out);
};

// top, left, bottom, right
template <>
struct LERPABLE_CORE_API Vectorizer<EdgeInsets> {
  static constexpr int kComponents = 4;
  static Status encode(const EdgeInsets& value, Vector* out);
  static Status decode(const Vector& values, EdgeInsets* out);
};

template <typename T>
constexpr int components() {
  return Vectorizer<T>::kComponents;
}

// Arity of the type currently held by `value`.
LERPABLE_CORE_API int components(const Interpolatable& value);

// Status::ArityMismatch (logged, and written to `mismatch` if given) unless
// `values.size() == expected`.
LERPABLE_CORE_API Status checkArity(int expected, const Vector& values,
                                    ArityMismatch* mismatch = nullptr);

template <typename T>
Status interpolatedFrom(const Vector& values, T* out, ArityMismatch* mismatch = nullptr) {
  if (!out) return Status::InvalidParameter;
  const Status st = checkArity(Vectorizer<T>::kComponents, values, mismatch);
  if (!ok(st)) return st;
  return Vectorizer<T>::decode(values, out);
}

namespace detail {

template <typename T>
Status reconstructAs(const Vector& values, Interpolatable* out, ArityMismatch* mismatch) {
  if (!out) return Status::InvalidParameter;
  T typed{};
  const Status st = interpolatedFrom<T>(values, &typed, mismatch);
  if (!ok(st)) return st;
  out->emplace<T>(std::move(typed));
  return Status::Success;
}

}  // namespace detail

template <typename T>
Status vectorize(const T& value, NumericVector* out) {
  if (!out) return Status::InvalidParameter;
  Vector values;
  const Status st = Vectorizer<T>::encode(value, &values);
  if (!ok(st)) return st;
  *out = NumericVector(std::move(values), &detail::reconstructAs<T>);
  return Status::Success;
}

// Binds the reconstruction to the model chosen at encode time.
LERPABLE_CORE_API Status vectorize(const Color& value, NumericVector* out);

// Dispatches on the held alternative.
LERPABLE_CORE_API Status vectorize(const Interpolatable& value, NumericVector* out);

}  // namespace lerpable::core
