#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "lerpable/core/interpolate.hpp"
#include "lerpable/core/interpolator.hpp"
#include "lerpable/core/vectorize.hpp"

using lerpable::core::Color;
using lerpable::core::Interpolator;
using lerpable::core::NumericVector;
using lerpable::core::Rect;
using lerpable::core::Status;
using lerpable::core::Transform3D;
using lerpable::core::lerp;
using lerpable::core::ok;
using lerpable::core::vectorize;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// One frame the way a driver would run it: blend the endpoints, then read the typed value.
template <typename T>
static double runFrames(const T& from, const T& to, int iters) {
  NumericVector a;
  NumericVector b;
  if (!ok(vectorize(from, &a)) || !ok(vectorize(to, &b))) {
    std::cerr << "vectorize failed\n";
    std::exit(1);
  }

  NumericVector current = a;
  double acc = 0.0;
  for (int i = 0; i < iters; ++i) {
    const double t = static_cast<double>(i % 1000) / 1000.0;
    const Status st = lerp(a, b, t, &current);
    T value{};
    if (!ok(st) || !ok(current.toValue(&value))) {
      std::cerr << "frame failed\n";
      std::exit(1);
    }
    acc += current.values()(0);
  }
  return acc;
}

static double runInterpolator(int iters) {
  Interpolator interp;
  if (!ok(Interpolator::create(Rect(0, 0, 10, 10), Rect(100, 100, 20, 20), &interp))) {
    std::cerr << "Interpolator::create failed\n";
    std::exit(1);
  }
  double acc = 0.0;
  Rect r;
  for (int i = 0; i < iters; ++i) {
    if (!ok(interp.setProgress(static_cast<double>(i % 1000) / 1000.0)) ||
        !ok(interp.valueAs(&r))) {
      std::cerr << "setProgress failed\n";
      std::exit(1);
    }
    acc += r.origin.x;
  }
  return acc;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: lerpable_core_benchmark [--iters=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int iters = parseIntArg(argc, argv, "--iters", 100000);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  Transform3D m0 = Transform3D::Identity();
  Transform3D m1 = Transform3D::Identity();
  m1(3, 0) = 120.0;
  m1(2, 3) = -1.0 / 500.0;

  const Rect r0(0, 0, 10, 10);
  const Rect r1(100, 100, 20, 20);
  const Color c0 = Color::rgba(0.2, 0.4, 0.6, 1.0);
  const Color c1 = Color::rgba(0.9, 0.1, 0.3, 0.5);

  double acc = 0.0;
  std::vector<double> transform_runs;
  std::vector<double> rect_runs;
  std::vector<double> color_runs;
  std::vector<double> interp_runs;
  transform_runs.reserve(trials);
  rect_runs.reserve(trials);
  color_runs.reserve(trials);
  interp_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    acc += runFrames(m0, m1, iters);
    acc += runFrames(r0, r1, iters);
    acc += runFrames(c0, c1, iters);
    acc += runInterpolator(iters);
  }

  for (int i = 0; i < trials; ++i) {
    transform_runs.push_back(benchMs([&]() { acc += runFrames(m0, m1, iters); }));
    rect_runs.push_back(benchMs([&]() { acc += runFrames(r0, r1, iters); }));
    color_runs.push_back(benchMs([&]() { acc += runFrames(c0, c1, iters); }));
    interp_runs.push_back(benchMs([&]() { acc += runInterpolator(iters); }));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double transform_ms = median(transform_runs);
  const double rect_ms = median(rect_runs);
  const double color_ms = median(color_runs);
  const double interp_ms = median(interp_runs);

  std::cout << "lerpable_core_benchmark\n";
  std::cout << "  iters: " << iters << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  Transform3D frame: " << transform_ms << " ms total, "
            << (transform_ms * 1000.0 / iters) << " us/frame\n";
  std::cout << "  Rect frame:        " << rect_ms << " ms total, "
            << (rect_ms * 1000.0 / iters) << " us/frame\n";
  std::cout << "  Color frame:       " << color_ms << " ms total, "
            << (color_ms * 1000.0 / iters) << " us/frame\n";
  std::cout << "  Interpolator:      " << interp_ms << " ms total, "
            << (interp_ms * 1000.0 / iters) << " us/frame\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}
