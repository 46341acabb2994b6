#pragma once
#include "lerpable/core/math/types.hpp"

#include <cstdint>

namespace lerpable::core {

// Boxed numeric value that remembers whether it was created from an integer
// or a real. Interpolation always works on the Real view.
class LERPABLE_CORE_API Number {
public:
  enum class Kind : std::uint8_t {
    Integer = 0,
    Real = 1
  };

  Number() = default;
  explicit Number(std::int64_t v) : kind_(Kind::Integer), int_(v) {}
  explicit Number(int v) : Number(static_cast<std::int64_t>(v)) {}
  explicit Number(double v) : kind_(Kind::Real), real_(v) {}

  Kind kind() const { return kind_; }
  bool isInteger() const { return kind_ == Kind::Integer; }

  // Integers beyond +/-2^53 lose precision in this view.
  Real toReal() const;

  // Truncates toward zero for Real-kind numbers.
  std::int64_t toInt64() const;

  bool operator==(const Number& other) const;
  bool operator!=(const Number& other) const { return !(*this == other); }

private:
  Kind kind_{Kind::Integer};
  std::int64_t int_{0};
  Real real_{0.0};
};

}  // namespace lerpable::core
