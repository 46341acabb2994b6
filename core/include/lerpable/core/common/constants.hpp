#pragma once

namespace lerpable::core {

struct Tolerances {
  double roundtrip_eps = 1.0e-6;

  // Largest integer magnitude the Real encoding represents exactly (2^53).
  double max_exact_integer = 9007199254740992.0;

  // color model checks (grayscale detection, hue wrap)
  double color_eps = 1.0e-12;
};

inline constexpr Tolerances kDefaultTolerances{};

}  // namespace lerpable::core
