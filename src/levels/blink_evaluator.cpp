#include <veritas/levels/blink_evaluator.hpp>
#include "signal_math.hpp"

namespace veritas::levels {

namespace vc = veritas::core;

BlinkEvaluator::BlinkEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::Blink, std::move(settings)) {}

std::size_t BlinkEvaluator::count_blinks(std::span<const double> ear) {
  std::size_t blinks = 0;
  std::size_t closed = 0;
  for (const double e : ear) {
    if (e < kBlinkEar) {
      ++closed;
    } else {
      if (closed >= kBlinkMinFrames) ++blinks;
      closed = 0;
    }
  }
  return blinks;
}

bool BlinkEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("EAR");
}

std::vector<double> BlinkEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    out.push_back(math::band_distance(*f.metric("EAR"), kOpenEyeLow, kOpenEyeHigh));
  }
  return out;
}

double BlinkEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& /*stats*/,
    vc::LevelDetail& detail) const {
  std::vector<double> ear;
  ear.reserve(frames.size());
  for (const auto& f : frames) ear.push_back(*f.metric("EAR"));

  const std::size_t blinks = count_blinks(ear);
  double duration = frames.back().timestamp - frames.front().timestamp;
  if (duration <= 0.0) {
    duration = static_cast<double>(frames.size()) / kFallbackFps;
  }
  const double rate = static_cast<double>(blinks) / duration;
  const double mean_ear = math::mean_of(ear);
  const double std_ear = math::stddev_of(ear);

  detail.metrics["blink_count"] = static_cast<double>(blinks);
  detail.metrics["blink_rate"] = rate;
  detail.metrics["duration_s"] = duration;
  detail.metrics["mean_ear"] = mean_ear;
  detail.metrics["std_ear"] = std_ear;

  if (rate < kNaturalRateLow) detail.reasons.push_back("low_blink_rate");
  if (rate > kNaturalRateHigh) detail.reasons.push_back("high_blink_rate");

  const bool flat = std_ear < kMinEarStd;
  if (flat) detail.reasons.push_back("low_ear_variance");
  const bool abnormal = mean_ear < kOpenEyeLow || mean_ear > kOpenEyeHigh;
  if (abnormal) detail.reasons.push_back("abnormal_ear");

  const double rate_anomaly =
      math::band_distance(rate, kNaturalRateLow, kNaturalRateHigh);
  return 0.6 * rate_anomaly + (flat ? 0.2 : 0.0) + (abnormal ? 0.2 : 0.0);
}

}  // namespace veritas::levels
