#include <veritas/levels/texture_evaluator.hpp>
#include "signal_math.hpp"

namespace veritas::levels {

namespace vc = veritas::core;

namespace {

// Natural share of spectral energy above the high-frequency cutoff for
// camera footage; generator upsampling pushes it outside this band.
constexpr double kHfRatioLow = 0.05;
constexpr double kHfRatioHigh = 0.35;
constexpr double kHighFakeRatio = 0.5;

}  // namespace

TextureEvaluator::TextureEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::Texture, std::move(settings)) {}

bool TextureEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("texture_score") || record.has_metric("hf_ratio");
}

std::vector<double> TextureEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    if (const auto s = f.metric("texture_score")) {
      out.push_back(math::clamp01(*s));
    } else {
      out.push_back(math::band_distance(*f.metric("hf_ratio"), kHfRatioLow, kHfRatioHigh));
    }
  }
  return out;
}

double TextureEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& stats,
    vc::LevelDetail& detail) const {
  std::vector<double> lbp;
  std::vector<double> hf;
  for (const auto& f : frames) {
    if (const auto v = f.metric("lbp_energy")) lbp.push_back(*v);
    if (const auto v = f.metric("hf_ratio")) hf.push_back(*v);
  }
  if (!lbp.empty()) detail.metrics["mean_lbp_energy"] = math::mean_of(lbp);
  if (!hf.empty()) detail.metrics["mean_hf_ratio"] = math::mean_of(hf);

  const double fake_ratio = stats.rate.value_or(0.0);
  detail.metrics["fake_ratio"] = fake_ratio;
  if (fake_ratio > kHighFakeRatio) detail.reasons.push_back("high_fake_ratio");

  return 0.5 * stats.mean.value_or(0.0) + 0.5 * fake_ratio;
}

}  // namespace veritas::levels
