#include "lerpable/core/interpolator.hpp"

#include "lerpable/core/common/logger.hpp"
#include "lerpable/core/interpolate.hpp"
#include "lerpable/core/vectorize.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lerpable::core {

// Color endpoints in different models are both re-expressed as RGB so the
// blend runs over one representation and reproduces either endpoint.
static void unifyColorModels(Interpolatable* from, Interpolatable* to) {
  Color* a = std::get_if<Color>(from);
  Color* b = std::get_if<Color>(to);
  if (!a || !b) return;

  ColorModel ma = ColorModel::Rgba;
  ColorModel mb = ColorModel::Rgba;
  if (!ok(Vectorizer<Color>::selectModel(*a, &ma)) ||
      !ok(Vectorizer<Color>::selectModel(*b, &mb)) || ma == mb) {
    return;
  }
  if (shouldLog(LogLevel::Info)) {
    log(LogLevel::Info, std::string("Interpolator: endpoints use different color models (") +
                        colorModelToString(ma) + " vs " + colorModelToString(mb) +
                        "); blending in RGBA");
  }
  *a = a->toRgb();
  *b = b->toRgb();
}

Status Interpolator::create(const Interpolatable& from, const Interpolatable& to,
                            Interpolator* out, InterpolatorOptions opt) {
  if (!out) {
    log(LogLevel::Error, "Interpolator::create: null output");
    return Status::InvalidParameter;
  }
  if (from.index() != to.index()) {
    log(LogLevel::Error, "Interpolator::create: endpoints hold different types");
    return Status::TypeMismatch;
  }

  Interpolatable start = from;
  Interpolatable end = to;
  unifyColorModels(&start, &end);

  Interpolator tmp;
  Status st = vectorize(start, &tmp.from_);
  if (!ok(st)) return st;
  st = vectorize(end, &tmp.to_);
  if (!ok(st)) return st;

  tmp.current_ = tmp.from_;
  tmp.progress_ = 0.0;
  tmp.opt_ = std::move(opt);

  if (shouldLog(LogLevel::Debug)) {
    log(LogLevel::Debug, "Interpolator::create: " + std::to_string(tmp.from_.size()) +
                         " components");
  }
  *out = std::move(tmp);
  return Status::Success;
}

Status Interpolator::setProgress(double progress) {
  if (!from_.isBound()) {
    log(LogLevel::Error, "Interpolator::setProgress: interpolator not created");
    return Status::Failure;
  }
  if (!std::isfinite(progress)) {
    log(LogLevel::Error, "Interpolator::setProgress: progress is non-finite");
    return Status::InvalidParameter;
  }

  const double p = opt_.clamp_progress ? std::max(0.0, std::min(1.0, progress)) : progress;
  const double eased = opt_.easing ? opt_.easing(p) : p;

  const Status st = lerp(from_, to_, eased, &current_);
  if (!ok(st)) return st;
  progress_ = p;

  if (opt_.apply) {
    Interpolatable v;
    const Status vst = current_.toInterpolatable(&v);
    if (!ok(vst)) return vst;
    opt_.apply(v);
  }
  return Status::Success;
}

}  // namespace lerpable::core
