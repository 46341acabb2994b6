#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "lerpable/core/common/logger.hpp"
#include "lerpable/core/common/status.hpp"
#include "lerpable/core/value/numeric_vector.hpp"
#include "lerpable/core/vectorize.hpp"

using lerpable::core::ArityMismatch;
using lerpable::core::Color;
using lerpable::core::Interpolatable;
using lerpable::core::LogLevel;
using lerpable::core::NumericVector;
using lerpable::core::Point;
using lerpable::core::Rect;
using lerpable::core::Status;
using lerpable::core::Vector;
using lerpable::core::ok;
using lerpable::core::vectorize;

static std::vector<std::string> g_messages;

static void captureSink(LogLevel, const std::string& msg) {
  g_messages.push_back(msg);
}

static void test_copy_is_independent() {
  NumericVector original;
  assert(ok(vectorize(Point{1.0, 2.0}, &original)));

  NumericVector copy(original);
  copy.mutableValues()(0) = 10.0;

  assert(original.values()(0) == 1.0);
  assert(copy.values()(0) == 10.0);

  Point p;
  assert(ok(original.toValue(&p)));
  assert(p.x == 1.0 && p.y == 2.0);
  assert(ok(copy.toValue(&p)));  // same bound type
  assert(p.x == 10.0 && p.y == 2.0);

  NumericVector assigned;
  assigned = copy;
  Vector v(2);
  v << -3.0, -4.0;
  assigned.setValues(v);
  assert(copy.values()(0) == 10.0);
  assert(ok(assigned.toValue(&p)));
  assert(p.x == -3.0 && p.y == -4.0);
}

static void test_explicit_reconstruction() {
  int calls = 0;
  Vector v(2);
  v << 0.5, 0.25;
  NumericVector vec(v, [&calls](const Vector& values, Interpolatable* out, ArityMismatch*) {
    ++calls;
    out->emplace<Point>(Point{values(0) * 2.0, values(1) * 2.0});
    return Status::Success;
  });
  assert(vec.isBound());

  Point p;
  assert(ok(vec.toValue(&p)));
  assert(p.x == 1.0 && p.y == 0.5);
  assert(calls == 1);
}

static void test_reconstruction_is_repeatable() {
  NumericVector vec;
  assert(ok(vectorize(Rect(1, 2, 3, 4), &vec)));

  Interpolatable a;
  Interpolatable b;
  assert(ok(vec.toInterpolatable(&a)));
  assert(ok(vec.toInterpolatable(&b)));
  const Rect* ra = std::get_if<Rect>(&a);
  const Rect* rb = std::get_if<Rect>(&b);
  assert(ra && rb);
  assert(ra->origin.x == rb->origin.x && ra->origin.y == rb->origin.y);
  assert(ra->size.width == rb->size.width && ra->size.height == rb->size.height);

  // No caching: a mutation shows up on the next read.
  vec.mutableValues()(2) = 30.0;
  Rect r;
  assert(ok(vec.toValue(&r)));
  assert(r.size.width == 30.0);
}

static void test_length_change_fails_on_read() {
  NumericVector vec;
  assert(ok(vectorize(Rect(1, 2, 3, 4), &vec)));

  Vector shorter(2);
  shorter << 1.0, 2.0;
  vec.setValues(shorter);  // accepted at write time
  assert(vec.size() == 2);

  Interpolatable out;
  ArityMismatch mm;
  assert(vec.toInterpolatable(&out, &mm) == Status::ArityMismatch);
  assert(mm.expected == 4 && mm.actual == 2);

  // color reconstruction is tier-bound but validates length the same way
  NumericVector color;
  assert(ok(vectorize(Color::white(0.5), &color)));
  color.setValues(shorter);
  assert(color.toInterpolatable(&out, &mm) == Status::ArityMismatch);
  assert(mm.expected == 4 && mm.actual == 2);
}

static void test_unbound_and_type_mismatch() {
  NumericVector empty;
  assert(!empty.isBound());
  Interpolatable out;
  assert(empty.toInterpolatable(&out) == Status::Failure);
  assert(empty.toInterpolatable(nullptr) == Status::InvalidParameter);

  NumericVector vec;
  assert(ok(vectorize(Point{1.0, 2.0}, &vec)));
  Rect r;
  assert(vec.toValue(&r) == Status::TypeMismatch);
}

static void test_arity_is_logged() {
  g_messages.clear();
  lerpable::core::setLogSink(&captureSink);
  lerpable::core::setLogLevel(LogLevel::Warn);

  NumericVector vec;
  assert(ok(vectorize(Rect(1, 2, 3, 4), &vec)));
  Vector v(3);
  v << 1.0, 2.0, 3.0;
  vec.setValues(v);
  Interpolatable out;
  assert(vec.toInterpolatable(&out) == Status::ArityMismatch);

  assert(g_messages.size() == 1);
  assert(g_messages[0].find("expected 4 components, got 3") != std::string::npos);

  // Below threshold: unsupported colors log at Warn.
  lerpable::core::setLogLevel(LogLevel::Error);
  assert(vectorize(Color::cmyka(0, 0, 0, 1), &vec) == Status::UnsupportedColorSpace);
  assert(g_messages.size() == 1);

  lerpable::core::setLogLevel(LogLevel::Warn);
  assert(vectorize(Color::cmyka(0, 0, 0, 1), &vec) == Status::UnsupportedColorSpace);
  assert(g_messages.size() == 2);
  assert(g_messages[1].find("CMYK") != std::string::npos);

  lerpable::core::setLogSink(nullptr);
}

static void test_status_and_level_names() {
  assert(std::string(lerpable::core::statusToString(Status::ArityMismatch)) == "ArityMismatch");
  assert(std::string(lerpable::core::statusToString(Status::UnsupportedColorSpace)) ==
         "UnsupportedColorSpace");
  assert(lerpable::core::logLevelFromString("DEBUG") == LogLevel::Debug);
  assert(lerpable::core::logLevelFromString("warning") == LogLevel::Warn);
  assert(!lerpable::core::logLevelFromString("loud").has_value());
}

int main() {
  lerpable::core::setLogLevel(LogLevel::Error);
  test_copy_is_independent();
  test_explicit_reconstruction();
  test_reconstruction_is_repeatable();
  test_length_change_fails_on_read();
  test_unbound_and_type_mismatch();
  test_arity_is_logged();
  test_status_and_level_names();
  std::cout << "lerpable_numeric_vector_test: PASS\n";
  return 0;
}
