#pragma once
#include "lerpable/core/export.hpp"
#include "lerpable/core/common/status.hpp"
#include "lerpable/core/interpolatable.hpp"
#include "lerpable/core/value/numeric_vector.hpp"

#include <functional>
#include <utility>
#include <variant>

namespace lerpable::core {

// Maps linear progress to eased progress. Curves themselves live with the caller.
using EasingFn = std::function<double(double)>;

// Receives the reconstructed value after each progress update.
using ApplyFn = std::function<void(const Interpolatable&)>;

struct InterpolatorOptions {
  // Clamp progress to [0, 1] before easing; otherwise extrapolate.
  bool clamp_progress{false};

  EasingFn easing;  // identity when empty
  ApplyFn apply;    // optional
};

// Progress-driven interpolation between two values of the same type.
//
// Sketch:
// - `create()` vectorizes both endpoints once; current value starts at `from`.
// - `setProgress(p)` eases p, blends the endpoint encodings into the current
//   encoding and hands the reconstructed value to `apply`.
// There is no clock here: whoever drives the animation calls setProgress().
class LERPABLE_CORE_API Interpolator {
public:
  Interpolator() = default;

  template <typename T>
  static Status create(const T& from, const T& to, Interpolator* out,
                       InterpolatorOptions opt = {}) {
    return create(Interpolatable(std::in_place_type<T>, from),
                  Interpolatable(std::in_place_type<T>, to), out, std::move(opt));
  }

  // Endpoints must hold the same alternative (Status::TypeMismatch otherwise).
  static Status create(const Interpolatable& from, const Interpolatable& to,
                       Interpolator* out, InterpolatorOptions opt = {});

  Status setProgress(double progress);
  double progress() const { return progress_; }

  const NumericVector& from() const { return from_; }
  const NumericVector& to() const { return to_; }
  const NumericVector& current() const { return current_; }

  Status value(Interpolatable* out) const { return current_.toInterpolatable(out); }

  template <typename T>
  Status valueAs(T* out) const { return current_.toValue(out); }

private:
  NumericVector from_;
  NumericVector to_;
  NumericVector current_;
  double progress_{0.0};
  InterpolatorOptions opt_;
};

}  // namespace lerpable::core
