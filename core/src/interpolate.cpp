#include "lerpable/core/interpolate.hpp"

#include "lerpable/core/common/logger.hpp"

#include <cmath>
#include <string>

namespace lerpable::core {

Status lerp(const Vector& from, const Vector& to, double t, Vector* out,
            ArityMismatch* mismatch) {
  if (!out) {
    log(LogLevel::Error, "lerp: null output");
    return Status::InvalidParameter;
  }
  if (!std::isfinite(t)) {
    log(LogLevel::Error, "lerp: progress is non-finite");
    return Status::InvalidParameter;
  }
  if (from.size() != to.size()) {
    if (mismatch) {
      mismatch->expected = static_cast<int>(from.size());
      mismatch->actual = static_cast<int>(to.size());
    }
    log(LogLevel::Error, "lerp: endpoint sizes differ (" + std::to_string(from.size()) +
                         " vs " + std::to_string(to.size()) + ")");
    return Status::ArityMismatch;
  }

  *out = from + (to - from) * t;
  return Status::Success;
}

Status lerp(const NumericVector& from, const NumericVector& to, double t,
            NumericVector* out, ArityMismatch* mismatch) {
  if (!out) {
    log(LogLevel::Error, "lerp: null output");
    return Status::InvalidParameter;
  }
  Vector blended;
  const Status st = lerp(from.values(), to.values(), t, &blended, mismatch);
  if (!ok(st)) return st;

  *out = from;
  out->setValues(blended);
  return Status::Success;
}

}  // namespace lerpable::core
