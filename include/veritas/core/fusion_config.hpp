#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/level.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <optional>

namespace veritas::core {

/// Per-level weights indexed by level_index(); must sum to 1.
using LevelWeights = std::array<double, kLevelCount>;

/// Per-level thresholds indexed by level_index().
using LevelThresholds = std::array<double, kLevelCount>;

/// Probability cut points for the final decision.
struct DecisionThresholds {
  double suspicious_low{0.35};  // p < suspicious_low -> Genuine
  double deepfake_low{0.65};    // p >= deepfake_low -> Deepfake
};

/// Tunables for fusion, escalation and per-level aggregation.
/// Loaded once at process start and shared read-only between runs.
struct FusionConfig {
  /// Lipsync and texture weigh most (most diagnostic signals).
  LevelWeights weights{0.10, 0.15, 0.15, 0.20, 0.15, 0.25};
  double high_confidence_fake_threshold{0.85};
  std::size_t minimum_support{10};
  /// Per-frame anomaly threshold used for run and rate detection.
  LevelThresholds anomaly_thresholds{0.5, 0.5, 0.5, 0.5, 0.5, 0.5};
  DecisionThresholds decision_thresholds{};

  std::size_t max_consecutive_failures{3};
  /// Longest anomalous run (frames) that flags a level as sustained.
  std::size_t sustained_run{5};
  /// Sliding window (frames) for temporal aggregation; unset = whole sequence.
  std::optional<std::size_t> aggregation_window;

  [[nodiscard]] double weight(LevelId level) const noexcept {
    return weights[level_index(level)];
  }
  [[nodiscard]] double anomaly_threshold(LevelId level) const noexcept {
    return anomaly_thresholds[level_index(level)];
  }
};

/// Tolerance when checking that weights sum to 1.
inline constexpr double kWeightSumTolerance = 1e-6;

/// Checks weights (finite, non-negative, sum to 1), thresholds in [0,1],
/// suspicious_low <= deepfake_low and a non-zero failure limit.
[[nodiscard]] std::expected<void, FusionError> validate_config(
    const FusionConfig& config);

}  // namespace veritas::core
