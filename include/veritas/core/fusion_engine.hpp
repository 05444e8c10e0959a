#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/fusion_config.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_result.hpp>
#include <veritas/core/verdict.hpp>
#include <expected>
#include <set>
#include <span>

namespace veritas::core {

/// Result of combining the evaluated levels.
struct FusionOutcome {
  double probability{0.0};
  std::set<LevelId> triggered_flags;
  /// Weights actually applied after renormalization; 0 for levels without support.
  LevelWeights effective_weights{};
  /// Weighted standard deviation of level scores around the probability;
  /// large values mean the levels disagree.
  double disagreement{0.0};
};

/// Weighted combination of level scores.
///
/// Only levels with support > 0 take part. Their configured weights are
/// renormalized to sum to 1, so a run that stopped early or lost a detector
/// still yields a probability on the same scale. If all participating levels
/// have weight 0 they share equally. Stateless: fuse() is idempotent and safe
/// to call concurrently.
class FusionEngine {
 public:
  explicit FusionEngine(LevelWeights weights = FusionConfig{}.weights,
                        DecisionThresholds thresholds = {});

  /// InsufficientEvidence if no level has support > 0.
  [[nodiscard]] std::expected<FusionOutcome, FusionError> fuse(
      std::span<const LevelResult> level_results) const;

  [[nodiscard]] Decision decide(double probability) const noexcept;

  [[nodiscard]] const LevelWeights& weights() const noexcept { return weights_; }
  [[nodiscard]] const DecisionThresholds& thresholds() const noexcept {
    return thresholds_;
  }

 private:
  LevelWeights weights_;
  DecisionThresholds thresholds_;
};

/// Maps a probability to Genuine / Suspicious / Deepfake.
[[nodiscard]] Decision decide(double probability,
                              const DecisionThresholds& thresholds) noexcept;

}  // namespace veritas::core
