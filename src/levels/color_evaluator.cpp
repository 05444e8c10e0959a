#include <veritas/levels/color_evaluator.hpp>
#include "signal_math.hpp"
#include <algorithm>
#include <cmath>

namespace veritas::levels {

namespace vc = veritas::core;

namespace {

constexpr double kHueTolerance = 20.0;   // degrees
constexpr double kLumaTolerance = 40.0;  // 8-bit levels
constexpr double kMismatchRate = 0.5;
constexpr double kFlickerHueStd = 15.0;

}  // namespace

ColorEvaluator::ColorEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::Color, std::move(settings)) {}

bool ColorEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("hue_delta") && record.has_metric("luma_delta");
}

std::vector<double> ColorEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    const double hue = math::clamp01(std::abs(*f.metric("hue_delta")) / kHueTolerance);
    const double luma = math::clamp01(std::abs(*f.metric("luma_delta")) / kLumaTolerance);
    out.push_back(std::max(hue, luma));
  }
  return out;
}

double ColorEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& stats,
    vc::LevelDetail& detail) const {
  std::vector<double> hue;
  std::vector<double> luma;
  for (const auto& f : frames) {
    hue.push_back(*f.metric("hue_delta"));
    luma.push_back(*f.metric("luma_delta"));
  }
  const double hue_std = math::stddev_of(hue);
  detail.metrics["mean_hue_delta"] = math::mean_of(hue);
  detail.metrics["hue_delta_std"] = hue_std;
  detail.metrics["mean_luma_delta"] = math::mean_of(luma);

  const double rate = stats.rate.value_or(0.0);
  if (rate > kMismatchRate) detail.reasons.push_back("color_mismatch");
  if (hue_std > kFlickerHueStd) detail.reasons.push_back("color_flicker");

  return 0.5 * stats.mean.value_or(0.0) + 0.5 * rate;
}

}  // namespace veritas::levels
