#pragma once
#include "lerpable/core/color/color.hpp"
#include "lerpable/core/math/number.hpp"
#include "lerpable/core/math/types.hpp"

#include <cstdint>
#include <variant>

namespace lerpable::core {

// Closed set of interpolatable value types. Adding a type means adding an
// alternative here and a `Vectorizer` specialization in vectorize.hpp.
using Interpolatable = std::variant<
    Transform3D,
    AffineTransform,
    Real,
    float,
    int,
    std::int64_t,
    Point,
    Rect,
    Size,
    Number,
    Color,
    EdgeInsets>;

}  // namespace lerpable::core
