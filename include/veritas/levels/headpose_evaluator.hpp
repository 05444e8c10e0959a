#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 3: head pose ("yaw", "pitch", "roll") and pose-derived expected versus
/// observed eye/mouth displacement ("expected_disp", "observed_disp").
/// Anomaly = 1 - |corr(expected, observed)|; motion that is frozen or jittery
/// adds to it.
class HeadPoseEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit HeadPoseEvaluator(veritas::core::EvaluatorSettings settings = {});

  static constexpr double kSmoothSpeedVariance = 1e-6;
  static constexpr double kJitterSpeedVariance = 0.01;

 protected:
  [[nodiscard]] bool usable(const veritas::core::FrameFeatureRecord& record) const override;

  [[nodiscard]] std::vector<double> frame_scores(
      std::span<const veritas::core::FrameFeatureRecord> frames) const override;

  [[nodiscard]] double level_score(
      std::span<const veritas::core::FrameFeatureRecord> frames,
      std::span<const double> scores,
      const veritas::core::AggregateStats& stats,
      veritas::core::LevelDetail& detail) const override;
};

}  // namespace veritas::levels
