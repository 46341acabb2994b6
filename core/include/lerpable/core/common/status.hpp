#pragma once
#include "lerpable/core/export.hpp"
#include <cstdint>

namespace lerpable::core {

enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  ArityMismatch = 3,
  UnsupportedColorSpace = 4,
  TypeMismatch = 5
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

LERPABLE_CORE_API const char* statusToString(Status s);

// Filled alongside Status::ArityMismatch when the caller asks for details.
struct ArityMismatch {
  int expected = 0;
  int actual = 0;
};

}  // namespace lerpable::core
