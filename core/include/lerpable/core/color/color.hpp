#pragma once
#include "lerpable/core/export.hpp"
#include "lerpable/core/common/constants.hpp"
#include "lerpable/core/math/types.hpp"

#include <cstdint>

namespace lerpable::core {

enum class ColorSpace : std::uint8_t {
  Rgb = 0,
  Grayscale = 1,
  Hsb = 2,
  Cmyk = 3
};

LERPABLE_CORE_API const char* colorSpaceToString(ColorSpace space);

// Color value stored in its native color space. All components, hue included,
// are normalized to [0, 1]; they are not clamped so extrapolated colors survive.
//
// Component accessors mirror platform color APIs: each returns false when the
// color cannot be expressed in that model without a lossy conversion.
// - getRed: native RGB colors only.
// - getWhite: native grayscale colors only.
// - getHue: native HSB colors, and RGB colors through conversion.
class LERPABLE_CORE_API Color {
public:
  Color() = default;

  static Color rgba(Real red, Real green, Real blue, Real alpha = 1.0);
  static Color white(Real white, Real alpha = 1.0);
  static Color hsba(Real hue, Real saturation, Real brightness, Real alpha = 1.0);
  static Color cmyka(Real cyan, Real magenta, Real yellow, Real black, Real alpha = 1.0);

  ColorSpace space() const { return space_; }
  Real alpha() const { return alpha_; }

  // Native components in model order (unused slots are zero).
  const Eigen::Vector4d& components() const { return c_; }

  bool getRed(Real* red, Real* green, Real* blue, Real* alpha) const;
  bool getWhite(Real* white, Real* alpha) const;
  bool getHue(Real* hue, Real* saturation, Real* brightness, Real* alpha) const;

  // Conversions into a model that interpolation supports.
  Color toRgb() const;
  Color toHsb() const;

  bool isApprox(const Color& other, double eps = kDefaultTolerances.roundtrip_eps) const;
  bool operator==(const Color& other) const;
  bool operator!=(const Color& other) const { return !(*this == other); }

private:
  Color(ColorSpace space, const Eigen::Vector4d& c, Real alpha)
    : space_(space), c_(c), alpha_(alpha) {}

  ColorSpace space_{ColorSpace::Rgb};
  Eigen::Vector4d c_{Eigen::Vector4d::Zero()};
  Real alpha_{1.0};
};

}  // namespace lerpable::core
