#include "lerpable/core/value/numeric_vector.hpp"

#include "lerpable/core/common/logger.hpp"

#include <utility>

namespace lerpable::core {

NumericVector::NumericVector(Vector values, ReconstructFn reconstruct)
  : values_(std::move(values)), reconstruct_(std::move(reconstruct)) {}

Status NumericVector::toInterpolatable(Interpolatable* out, ArityMismatch* mismatch) const {
  if (!out) {
    log(LogLevel::Error, "NumericVector::toInterpolatable: null output");
    return Status::InvalidParameter;
  }
  if (!reconstruct_) {
    log(LogLevel::Error, "NumericVector::toInterpolatable: no reconstruction bound");
    return Status::Failure;
  }
  return reconstruct_(values_, out, mismatch);
}

}  // namespace lerpable::core
