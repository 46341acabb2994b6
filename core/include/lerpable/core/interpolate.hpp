#pragma once
#include "lerpable/core/export.hpp"
#include "lerpable/core/common/status.hpp"
#include "lerpable/core/value/numeric_vector.hpp"

namespace lerpable::core {

// Element-wise linear blend: out[i] = from[i] + (to[i] - from[i]) * t.
// `t` is not clamped; values outside [0, 1] extrapolate.
LERPABLE_CORE_API Status lerp(const Vector& from, const Vector& to, double t, Vector* out,
                              ArityMismatch* mismatch = nullptr);

// Blends the values of two encodings. `out` becomes a copy of `from` (and
// therefore reconstructs to from's type) holding the blended values.
LERPABLE_CORE_API Status lerp(const NumericVector& from, const NumericVector& to, double t,
                              NumericVector* out, ArityMismatch* mismatch = nullptr);

}  // namespace lerpable::core
