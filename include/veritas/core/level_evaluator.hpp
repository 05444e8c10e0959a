#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/frame_feature_record.hpp>
#include <veritas/core/fusion_config.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_result.hpp>
#include <veritas/core/temporal_aggregator.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace veritas::core {

/// Per-level slice of FusionConfig handed to an evaluator.
struct EvaluatorSettings {
  double anomaly_threshold{0.5};
  std::size_t minimum_support{10};
  std::size_t sustained_run{5};
  std::optional<std::size_t> window;

  [[nodiscard]] static EvaluatorSettings for_level(const FusionConfig& config,
                                                   LevelId level);
};

/// Abstract level evaluator: records of one level -> LevelResult.
/// Implementations are pure: same input (in any order) gives the same result,
/// and evaluate() may be called concurrently.
class ILevelEvaluator {
 public:
  virtual ~ILevelEvaluator() = default;

  [[nodiscard]] virtual LevelId level() const noexcept = 0;

  /// ExtractionError if \p level is not this evaluator's level or any record
  /// carries another level. Empty input is not an error: it yields support 0.
  [[nodiscard]] virtual std::expected<LevelResult, FusionError> evaluate(
      LevelId level,
      std::span<const FrameFeatureRecord> records) const = 0;
};

/// Common evaluate(): validates, drops unusable records, sorts the rest by
/// frame_index, scores every frame, aggregates and adds the generic reasons
/// (high_anomaly_score, sustained_anomaly). Subclasses supply the level math.
class LevelEvaluator : public ILevelEvaluator {
 public:
  LevelEvaluator(LevelId level, EvaluatorSettings settings);

  [[nodiscard]] LevelId level() const noexcept final { return level_; }

  [[nodiscard]] std::expected<LevelResult, FusionError> evaluate(
      LevelId level,
      std::span<const FrameFeatureRecord> records) const final;

  [[nodiscard]] const EvaluatorSettings& settings() const noexcept {
    return settings_;
  }

 protected:
  /// True if the record carries every metric this level needs (finite).
  [[nodiscard]] virtual bool usable(const FrameFeatureRecord& record) const = 0;

  /// One anomaly value per frame, in the order given; clamped to [0,1] by the
  /// caller, which drops frames whose value is NaN or infinite.
  [[nodiscard]] virtual std::vector<double> frame_scores(
      std::span<const FrameFeatureRecord> frames) const = 0;

  /// Level score in [0,1]. May add metrics and reasons to \p detail. A
  /// non-finite return makes the level InsufficientEvidence.
  [[nodiscard]] virtual double level_score(
      std::span<const FrameFeatureRecord> frames,
      std::span<const double> scores,
      const AggregateStats& stats,
      LevelDetail& detail) const = 0;

 private:
  LevelId level_;
  EvaluatorSettings settings_;
};

}  // namespace veritas::core
