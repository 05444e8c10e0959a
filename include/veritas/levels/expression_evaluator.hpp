#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 1: expression classifier output ("expression_label", "expression_confidence").
/// Low classifier confidence and a face stuck on one expression raise the score.
class ExpressionEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit ExpressionEvaluator(veritas::core::EvaluatorSettings settings = {});

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
