#include <cassert>
#include <cmath>
#include <iostream>

#include "lerpable/core/color/color.hpp"
#include "lerpable/core/common/logger.hpp"
#include "lerpable/core/interpolate.hpp"
#include "lerpable/core/vectorize.hpp"

using lerpable::core::Color;
using lerpable::core::ColorModel;
using lerpable::core::ColorSpace;
using lerpable::core::NumericVector;
using lerpable::core::Real;
using lerpable::core::Status;
using lerpable::core::Vector;
using lerpable::core::Vectorizer;
using lerpable::core::interpolatedFrom;
using lerpable::core::lerp;
using lerpable::core::ok;
using lerpable::core::vectorize;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static void test_rgba_tier() {
  const Color c = Color::rgba(0.2, 0.4, 0.6, 1.0);

  ColorModel model = ColorModel::Hsba;
  assert(ok(Vectorizer<Color>::selectModel(c, &model)));
  assert(model == ColorModel::Rgba);

  NumericVector vec;
  assert(ok(vectorize(c, &vec)));
  assert(vec.size() == 4);
  assert(vec.values()(0) == 0.2);
  assert(vec.values()(1) == 0.4);
  assert(vec.values()(2) == 0.6);
  assert(vec.values()(3) == 1.0);

  Color back;
  assert(ok(vec.toValue(&back)));
  assert(back == c);
}

static void test_grayscale_tier() {
  const Color c = Color::white(0.5, 1.0);

  ColorModel model = ColorModel::Rgba;
  assert(ok(Vectorizer<Color>::selectModel(c, &model)));
  assert(model == ColorModel::Grayscale);

  NumericVector vec;
  assert(ok(vectorize(c, &vec)));
  assert(vec.size() == 4);
  assert(vec.values()(0) == 0.5);
  assert(vec.values()(1) == 1.0);
  assert(vec.values()(2) == 0.0);
  assert(vec.values()(3) == 0.0);

  Color back;
  assert(ok(vec.toValue(&back)));
  assert(back.space() == ColorSpace::Grayscale);
  assert(back == c);

  // Padding slots are ignored on decode.
  Vector noisy = vec.values();
  noisy(2) = 0.9;
  noisy(3) = 0.9;
  vec.setValues(noisy);
  assert(ok(vec.toValue(&back)));
  assert(back == c);
}

static void test_hsb_tier() {
  const Color c = Color::hsba(0.25, 0.5, 0.75, 0.8);

  ColorModel model = ColorModel::Rgba;
  assert(ok(Vectorizer<Color>::selectModel(c, &model)));
  assert(model == ColorModel::Hsba);

  NumericVector vec;
  assert(ok(vectorize(c, &vec)));
  assert(vec.values()(0) == 0.25);
  assert(vec.values()(1) == 0.5);
  assert(vec.values()(2) == 0.75);
  assert(vec.values()(3) == 0.8);

  Color back;
  assert(ok(vec.toValue(&back)));
  assert(back.space() == ColorSpace::Hsb);
  assert(back.isApprox(c));
}

static void test_unsupported_color_space() {
  const Color c = Color::cmyka(0.1, 0.2, 0.3, 0.4);
  NumericVector vec;
  assert(vectorize(c, &vec) == Status::UnsupportedColorSpace);
  assert(!vec.isBound());

  // Normalizing to RGB first makes it interpolatable.
  assert(ok(vectorize(c.toRgb(), &vec)));
  assert(near(vec.values()(0), 0.9 * 0.6, 1e-12));
  assert(near(vec.values()(1), 0.8 * 0.6, 1e-12));
  assert(near(vec.values()(2), 0.7 * 0.6, 1e-12));
}

static void test_decode_without_model() {
  // A grayscale encoding read as RGBA is a valid color, just not the same one.
  const Color gray = Color::white(0.5, 1.0);
  NumericVector vec;
  assert(ok(vectorize(gray, &vec)));

  Color as_rgba;
  assert(ok(interpolatedFrom(vec.values(), &as_rgba)));
  assert(as_rgba.space() == ColorSpace::Rgb);
  assert(as_rgba != gray);

  Color via_model;
  assert(ok(Vectorizer<Color>::decode(vec.values(), ColorModel::Grayscale, &via_model)));
  assert(via_model == gray);
}

static void test_color_blend() {
  NumericVector a;
  NumericVector b;
  assert(ok(vectorize(Color::rgba(0.0, 0.0, 0.0, 1.0), &a)));
  assert(ok(vectorize(Color::rgba(1.0, 0.5, 0.25, 0.0), &b)));

  NumericVector mid;
  assert(ok(lerp(a, b, 0.5, &mid)));
  Color c;
  assert(ok(mid.toValue(&c)));
  Real r = 0.0, g = 0.0, bl = 0.0, al = 0.0;
  assert(c.getRed(&r, &g, &bl, &al));
  assert(near(r, 0.5, 1e-12));
  assert(near(g, 0.25, 1e-12));
  assert(near(bl, 0.125, 1e-12));
  assert(near(al, 0.5, 1e-12));
}

static void test_conversions() {
  Real h = 0.0, s = 0.0, v = 0.0, a = 0.0;

  // pure red
  assert(Color::rgba(1.0, 0.0, 0.0).getHue(&h, &s, &v, &a));
  assert(near(h, 0.0, 1e-12) && near(s, 1.0, 1e-12) && near(v, 1.0, 1e-12));

  // pure blue sits at 240 degrees
  assert(Color::rgba(0.0, 0.0, 1.0).getHue(&h, &s, &v, &a));
  assert(near(h, 2.0 / 3.0, 1e-12));

  const Color hsb = Color::hsba(1.0 / 3.0, 1.0, 1.0, 0.5);
  const Color rgb = hsb.toRgb();
  Real r = 0.0, g = 0.0, b = 0.0;
  assert(rgb.getRed(&r, &g, &b, &a));
  assert(near(r, 0.0, 1e-12) && near(g, 1.0, 1e-12) && near(b, 0.0, 1e-12));
  assert(near(a, 0.5, 1e-12));
  assert(rgb.toHsb().isApprox(hsb, 1e-12));

  assert(Color::white(0.3).toRgb().isApprox(Color::rgba(0.3, 0.3, 0.3), 1e-12));
  assert(!Color::white(0.3).getRed(nullptr, nullptr, nullptr, nullptr));
  assert(!Color::cmyka(0.0, 0.0, 0.0, 0.0).getHue(nullptr, nullptr, nullptr, nullptr));
}

int main() {
  lerpable::core::setLogLevel(lerpable::core::LogLevel::Error);
  test_rgba_tier();
  test_grayscale_tier();
  test_hsb_tier();
  test_unsupported_color_space();
  test_decode_without_model();
  test_color_blend();
  test_conversions();
  std::cout << "lerpable_color_test: PASS\n";
  return 0;
}
