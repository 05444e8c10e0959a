#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 4: per-frame texture classifier score ("texture_score") or, without a
/// classifier, the FFT high-frequency energy ratio ("hf_ratio") judged against
/// its natural band. "lbp_energy" is averaged into the audit detail.
class TextureEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit TextureEvaluator(veritas::core::EvaluatorSettings settings = {});

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
