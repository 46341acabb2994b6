// Color model conversions.
// - HSB uses the hexcone model with hue normalized to [0, 1).
// - CMYK -> RGB is the naive device conversion r = (1 - c)(1 - k); there is no
//   ICC profile involved, which is why CMYK colors are not interpolated directly.
#include "lerpable/core/color/color.hpp"

#include <cmath>

namespace lerpable::core {

const char* colorSpaceToString(ColorSpace space) {
  switch (space) {
    case ColorSpace::Rgb: return "RGB";
    case ColorSpace::Grayscale: return "Grayscale";
    case ColorSpace::Hsb: return "HSB";
    case ColorSpace::Cmyk: return "CMYK";
  }
  return "Unknown";
}

static Eigen::Vector3d hsbToRgb(Real h, Real s, Real v) {
  if (s <= 0.0) {
    return Eigen::Vector3d(v, v, v);
  }
  Real hh = std::fmod(h, 1.0);
  if (hh < 0.0) hh += 1.0;
  hh *= 6.0;

  const int sector = static_cast<int>(std::floor(hh)) % 6;
  const Real f = hh - std::floor(hh);
  const Real p = v * (1.0 - s);
  const Real q = v * (1.0 - s * f);
  const Real t = v * (1.0 - s * (1.0 - f));

  switch (sector) {
    case 0: return Eigen::Vector3d(v, t, p);
    case 1: return Eigen::Vector3d(q, v, p);
    case 2: return Eigen::Vector3d(p, v, t);
    case 3: return Eigen::Vector3d(p, q, v);
    case 4: return Eigen::Vector3d(t, p, v);
    default: return Eigen::Vector3d(v, p, q);
  }
}

static Eigen::Vector3d rgbToHsb(const Eigen::Vector3d& rgb) {
  const Real maxc = rgb.maxCoeff();
  const Real minc = rgb.minCoeff();
  const Real delta = maxc - minc;

  const Real v = maxc;
  const Real eps = kDefaultTolerances.color_eps;
  const Real s = (maxc > eps) ? delta / maxc : 0.0;
  if (delta <= eps) {
    return Eigen::Vector3d(0.0, s, v);
  }

  Real h;
  if (rgb.x() == maxc) {
    h = (rgb.y() - rgb.z()) / delta;
  } else if (rgb.y() == maxc) {
    h = 2.0 + (rgb.z() - rgb.x()) / delta;
  } else {
    h = 4.0 + (rgb.x() - rgb.y()) / delta;
  }
  h /= 6.0;
  if (h < 0.0) h += 1.0;
  return Eigen::Vector3d(h, s, v);
}

Color Color::rgba(Real red, Real green, Real blue, Real alpha) {
  return Color(ColorSpace::Rgb, Eigen::Vector4d(red, green, blue, 0.0), alpha);
}

Color Color::white(Real white, Real alpha) {
  return Color(ColorSpace::Grayscale, Eigen::Vector4d(white, 0.0, 0.0, 0.0), alpha);
}

Color Color::hsba(Real hue, Real saturation, Real brightness, Real alpha) {
  return Color(ColorSpace::Hsb, Eigen::Vector4d(hue, saturation, brightness, 0.0), alpha);
}

Color Color::cmyka(Real cyan, Real magenta, Real yellow, Real black, Real alpha) {
  return Color(ColorSpace::Cmyk, Eigen::Vector4d(cyan, magenta, yellow, black), alpha);
}

bool Color::getRed(Real* red, Real* green, Real* blue, Real* alpha) const {
  if (space_ != ColorSpace::Rgb) return false;
  if (red) *red = c_(0);
  if (green) *green = c_(1);
  if (blue) *blue = c_(2);
  if (alpha) *alpha = alpha_;
  return true;
}

bool Color::getWhite(Real* white, Real* alpha) const {
  if (space_ != ColorSpace::Grayscale) return false;
  if (white) *white = c_(0);
  if (alpha) *alpha = alpha_;
  return true;
}

bool Color::getHue(Real* hue, Real* saturation, Real* brightness, Real* alpha) const {
  Eigen::Vector3d hsb;
  if (space_ == ColorSpace::Hsb) {
    hsb = c_.head<3>();
  } else if (space_ == ColorSpace::Rgb) {
    hsb = rgbToHsb(c_.head<3>());
  } else {
    return false;
  }
  if (hue) *hue = hsb(0);
  if (saturation) *saturation = hsb(1);
  if (brightness) *brightness = hsb(2);
  if (alpha) *alpha = alpha_;
  return true;
}

Color Color::toRgb() const {
  switch (space_) {
    case ColorSpace::Rgb:
      return *this;
    case ColorSpace::Grayscale:
      return rgba(c_(0), c_(0), c_(0), alpha_);
    case ColorSpace::Hsb: {
      const Eigen::Vector3d rgb = hsbToRgb(c_(0), c_(1), c_(2));
      return rgba(rgb.x(), rgb.y(), rgb.z(), alpha_);
    }
    case ColorSpace::Cmyk: {
      const Real k = 1.0 - c_(3);
      return rgba((1.0 - c_(0)) * k, (1.0 - c_(1)) * k, (1.0 - c_(2)) * k, alpha_);
    }
  }
  return *this;
}

Color Color::toHsb() const {
  if (space_ == ColorSpace::Hsb) {
    return *this;
  }
  const Color rgb = toRgb();
  const Eigen::Vector3d hsb = rgbToHsb(rgb.c_.head<3>());
  return hsba(hsb(0), hsb(1), hsb(2), alpha_);
}

bool Color::isApprox(const Color& other, double eps) const {
  if (space_ != other.space_) return false;
  if (std::abs(alpha_ - other.alpha_) > eps) return false;
  return (c_ - other.c_).cwiseAbs().maxCoeff() <= eps;
}

bool Color::operator==(const Color& other) const {
  return space_ == other.space_ && alpha_ == other.alpha_ && c_ == other.c_;
}

}  // namespace lerpable::core
