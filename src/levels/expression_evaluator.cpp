#include <veritas/levels/expression_evaluator.hpp>
#include "signal_math.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>

namespace veritas::levels {

namespace vc = veritas::core;

namespace {

constexpr double kFrozenDominance = 0.95;
constexpr double kLowConfidence = 0.4;

}  // namespace

ExpressionEvaluator::ExpressionEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::Expression, std::move(settings)) {}

bool ExpressionEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("expression_label") &&
         record.has_metric("expression_confidence");
}

std::vector<double> ExpressionEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    out.push_back(1.0 - math::clamp01(*f.metric("expression_confidence")));
  }
  return out;
}

double ExpressionEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& stats,
    vc::LevelDetail& detail) const {
  std::map<std::int64_t, std::size_t> label_counts;
  std::vector<double> confidences;
  confidences.reserve(frames.size());
  for (const auto& f : frames) {
    ++label_counts[std::llround(*f.metric("expression_label"))];
    confidences.push_back(math::clamp01(*f.metric("expression_confidence")));
  }

  std::size_t dominant = 0;
  for (const auto& [label, count] : label_counts) dominant = std::max(dominant, count);
  const double dominance =
      static_cast<double>(dominant) / static_cast<double>(frames.size());
  const double mean_confidence = math::mean_of(confidences);

  detail.metrics["dominance"] = dominance;
  detail.metrics["label_diversity"] = static_cast<double>(label_counts.size());
  detail.metrics["mean_confidence"] = mean_confidence;

  if (dominance >= kFrozenDominance && frames.size() >= settings().minimum_support) {
    detail.reasons.push_back("frozen_expression");
  }
  if (mean_confidence < kLowConfidence) {
    detail.reasons.push_back("low_expression_confidence");
  }

  return 0.5 * stats.mean.value_or(0.0) +
         0.5 * math::clamp01((dominance - 0.5) / 0.5);
}

}  // namespace veritas::levels
