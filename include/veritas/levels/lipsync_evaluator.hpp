#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 6: mouth aspect ratio ("MAR") against audio energy ("audio_energy") per
/// segment. Speech should open the mouth: a weak or negative correlation is
/// the main anomaly.
class LipSyncEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit LipSyncEvaluator(veritas::core::EvaluatorSettings settings = {});

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
