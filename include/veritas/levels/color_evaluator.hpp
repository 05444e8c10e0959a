#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 5: hue difference in degrees ("hue_delta") and luminance difference
/// 0..255 ("luma_delta") between the face and its surroundings.
class ColorEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit ColorEvaluator(veritas::core::EvaluatorSettings settings = {});

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
