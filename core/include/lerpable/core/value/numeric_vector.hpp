#pragma once
#include "lerpable/core/export.hpp"
#include "lerpable/core/common/status.hpp"
#include "lerpable/core/interpolatable.hpp"
#include "lerpable/core/math/types.hpp"

#include <functional>
#include <variant>

namespace lerpable::core {

// Type-erased numeric encoding of an interpolatable value.
//
// Holds the current component values plus the reconstruction function bound by
// the `vectorize()` call that produced it. Only that function knows the
// originating type; the vector itself does not.
// - Copies share the reconstruction function and own independent values.
// - `setValues()` does not validate the length. Reconstruction does, and fails
//   with Status::ArityMismatch when the length no longer matches the bound type.
// - Not synchronized: each concurrent interpolation needs its own instance.
class LERPABLE_CORE_API NumericVector {
public:
  using ReconstructFn =
      std::function<Status(const Vector&, Interpolatable*, ArityMismatch*)>;

  NumericVector() = default;
  NumericVector(Vector values, ReconstructFn reconstruct);

  const Vector& values() const { return values_; }
  Vector& mutableValues() { return values_; }
  void setValues(const Vector& values) { values_ = values; }

  int size() const { return static_cast<int>(values_.size()); }
  bool isBound() const { return static_cast<bool>(reconstruct_); }

  // Reconstructs a fresh value from the current values. Repeated calls with
  // unchanged values produce equal results.
  Status toInterpolatable(Interpolatable* out, ArityMismatch* mismatch = nullptr) const;

  // Typed convenience; Status::TypeMismatch when the bound type is not T.
  template <typename T>
  Status toValue(T* out, ArityMismatch* mismatch = nullptr) const {
    if (!out) return Status::InvalidParameter;
    Interpolatable value;
    const Status st = toInterpolatable(&value, mismatch);
    if (!ok(st)) return st;
    const T* typed = std::get_if<T>(&value);
    if (!typed) return Status::TypeMismatch;
    *out = *typed;
    return Status::Success;
  }

private:
  Vector values_;
  ReconstructFn reconstruct_;
};

}  // namespace lerpable::core
