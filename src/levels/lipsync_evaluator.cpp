#include <veritas/levels/lipsync_evaluator.hpp>
#include "signal_math.hpp"
#include <algorithm>
#include <cmath>

namespace veritas::levels {

namespace vc = veritas::core;

namespace {

constexpr double kWeakCorrelation = 0.3;
constexpr double kZSpan = 4.0;
// Used when either signal is flat and the correlation says nothing.
constexpr double kUndefinedCorrelationAnomaly = 0.5;

std::vector<double> z_scores(std::span<const double> v) {
  const double m = math::mean_of(v);
  const double sd = math::stddev_of(v);
  std::vector<double> out;
  out.reserve(v.size());
  for (const double x : v) out.push_back(sd > 1e-12 ? (x - m) / sd : 0.0);
  return out;
}

void split_signals(std::span<const vc::FrameFeatureRecord> frames,
                   std::vector<double>& mar,
                   std::vector<double>& audio) {
  mar.reserve(frames.size());
  audio.reserve(frames.size());
  for (const auto& f : frames) {
    mar.push_back(*f.metric("MAR"));
    audio.push_back(*f.metric("audio_energy"));
  }
}

}  // namespace

LipSyncEvaluator::LipSyncEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::LipSync, std::move(settings)) {}

bool LipSyncEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("MAR") && record.has_metric("audio_energy");
}

std::vector<double> LipSyncEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> mar;
  std::vector<double> audio;
  split_signals(frames, mar, audio);
  const auto zm = z_scores(mar);
  const auto za = z_scores(audio);

  std::vector<double> out;
  out.reserve(frames.size());
  for (std::size_t i = 0; i < frames.size(); ++i) {
    out.push_back(math::clamp01(std::abs(zm[i] - za[i]) / kZSpan));
  }
  return out;
}

double LipSyncEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& stats,
    vc::LevelDetail& detail) const {
  std::vector<double> mar;
  std::vector<double> audio;
  split_signals(frames, mar, audio);

  double correlation_anomaly = kUndefinedCorrelationAnomaly;
  if (const auto r = math::pearson(mar, audio)) {
    detail.metrics["av_correlation"] = *r;
    correlation_anomaly = 1.0 - std::max(0.0, *r);
    if (*r < kWeakCorrelation) detail.reasons.push_back("weak_av_correlation");
  } else {
    detail.notes.push_back("flat_av_signal");
  }
  detail.metrics["mean_mar"] = math::mean_of(mar);

  return 0.7 * correlation_anomaly + 0.3 * stats.mean.value_or(0.0);
}

}  // namespace veritas::levels
