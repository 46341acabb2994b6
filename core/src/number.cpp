#include "lerpable/core/math/number.hpp"

#include <cmath>
#include <limits>

namespace lerpable::core {

Real Number::toReal() const {
  return kind_ == Kind::Integer ? static_cast<Real>(int_) : real_;
}

std::int64_t Number::toInt64() const {
  if (kind_ == Kind::Integer) {
    return int_;
  }
  if (!std::isfinite(real_)) {
    return 0;
  }
  // 2^63 is exactly representable; anything at or beyond it saturates.
  constexpr double kLimit = 9223372036854775808.0;
  if (real_ >= kLimit) return std::numeric_limits<std::int64_t>::max();
  if (real_ < -kLimit) return std::numeric_limits<std::int64_t>::min();
  return static_cast<std::int64_t>(std::trunc(real_));
}

bool Number::operator==(const Number& other) const {
  if (kind_ == Kind::Integer && other.kind_ == Kind::Integer) {
    return int_ == other.int_;
  }
  return toReal() == other.toReal();
}

}  // namespace lerpable::core
