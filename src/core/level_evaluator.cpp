#include <veritas/core/level_evaluator.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace veritas::core {

namespace {

/// Strict weak order on metric values: NaN sorts after every number and all
/// NaNs are equivalent.
bool value_less(double a, double b) noexcept {
  const bool a_nan = std::isnan(a);
  const bool b_nan = std::isnan(b);
  if (a_nan || b_nan) return !a_nan;
  return a < b;
}

bool metrics_less(const std::map<std::string, double>& a,
                  const std::map<std::string, double>& b) {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      [](const auto& x, const auto& y) {
        if (x.first != y.first) return x.first < y.first;
        return value_less(x.second, y.second);
      });
}

bool canonical_less(const FrameFeatureRecord& a, const FrameFeatureRecord& b) {
  if (a.frame_index != b.frame_index) return a.frame_index < b.frame_index;
  if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
  return metrics_less(a.raw_metrics, b.raw_metrics);
}

}  // namespace

EvaluatorSettings EvaluatorSettings::for_level(const FusionConfig& config,
                                               LevelId level) {
  EvaluatorSettings s;
  s.anomaly_threshold = config.anomaly_threshold(level);
  s.minimum_support = config.minimum_support;
  s.sustained_run = config.sustained_run;
  s.window = config.aggregation_window;
  return s;
}

LevelEvaluator::LevelEvaluator(LevelId level, EvaluatorSettings settings)
    : level_(level), settings_(std::move(settings)) {}

std::expected<LevelResult, FusionError> LevelEvaluator::evaluate(
    LevelId level,
    std::span<const FrameFeatureRecord> records) const {
  if (level != level_) {
    return std::unexpected(FusionError::ExtractionError);
  }

  std::vector<FrameFeatureRecord> candidates;
  candidates.reserve(records.size());
  for (const auto& record : records) {
    if (record.level != level_) {
      return std::unexpected(FusionError::ExtractionError);
    }
    if (std::isfinite(record.timestamp) && usable(record)) candidates.push_back(record);
  }

  // Canonical order: extraction may complete in any order.
  std::sort(candidates.begin(), candidates.end(), canonical_less);

  // Frames whose anomaly cannot be computed (overflowing metrics) are dropped too.
  std::vector<double> raw_scores = frame_scores(candidates);
  raw_scores.resize(candidates.size(), 0.0);
  std::vector<FrameFeatureRecord> frames;
  std::vector<double> scores;
  frames.reserve(candidates.size());
  scores.reserve(candidates.size());
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (!std::isfinite(raw_scores[i])) continue;
    frames.push_back(std::move(candidates[i]));
    scores.push_back(std::clamp(raw_scores[i], 0.0, 1.0));
  }
  const std::size_t dropped = records.size() - frames.size();

  LevelResult result;
  result.level = level_;
  result.detail.metrics["dropped_frames"] = static_cast<double>(dropped);
  if (dropped > 0) {
    result.detail.notes.push_back("dropped_invalid_frames");
  }

  if (frames.empty()) {
    result.status = LevelStatus::InsufficientEvidence;
    result.detail.notes.push_back(records.empty() ? "no_frames" : "no_usable_frames");
    return result;
  }

  const TemporalAggregator aggregator(settings_.anomaly_threshold);
  const AggregateStats stats = aggregator.aggregate(scores, settings_.window);

  auto& metrics = result.detail.metrics;
  metrics["frame_mean"] = stats.mean.value_or(0.0);
  metrics["frame_variance"] = stats.variance.value_or(0.0);
  metrics["anomaly_rate"] = stats.rate.value_or(0.0);
  metrics["max_anomaly_run"] = static_cast<double>(stats.max_run_above_threshold);

  const double raw_score = level_score(frames, scores, stats, result.detail);
  if (!std::isfinite(raw_score)) {
    result.status = LevelStatus::InsufficientEvidence;
    result.detail.notes.push_back("non_finite_level_score");
    return result;
  }
  const double score = std::clamp(raw_score, 0.0, 1.0);

  if (score >= settings_.anomaly_threshold) {
    result.detail.reasons.push_back("high_anomaly_score");
  }
  if (settings_.sustained_run > 0 &&
      stats.max_run_above_threshold >= settings_.sustained_run) {
    result.detail.reasons.push_back("sustained_anomaly");
  }

  result.status = LevelStatus::Evaluated;
  result.score = score;
  result.support = frames.size();
  result.suspicious = !result.detail.reasons.empty();
  return result;
}

}  // namespace veritas::core
