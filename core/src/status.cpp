#include "lerpable/core/common/status.hpp"

namespace lerpable::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::ArityMismatch: return "ArityMismatch";
    case Status::UnsupportedColorSpace: return "UnsupportedColorSpace";
    case Status::TypeMismatch: return "TypeMismatch";
  }
  return "Unknown";
}

}  // namespace lerpable::core
