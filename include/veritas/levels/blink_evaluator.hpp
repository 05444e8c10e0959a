#pragma once

#include <veritas/core/level_evaluator.hpp>
#include <cstddef>
#include <span>
#include <vector>

namespace veritas::levels {

/// Level 2: eye aspect ratio per frame ("EAR").
///
/// A blink is EAR below kBlinkEar for at least kBlinkMinFrames consecutive
/// samples. The blink rate (per second, from timestamps) is compared with the
/// natural range [kNaturalRateLow, kNaturalRateHigh]; a flat EAR signal or a
/// mean EAR outside the open-eye band adds to the score.
class BlinkEvaluator : public veritas::core::LevelEvaluator {
 public:
  explicit BlinkEvaluator(veritas::core::EvaluatorSettings settings = {});

  static constexpr double kBlinkEar = 0.25;
  static constexpr std::size_t kBlinkMinFrames = 2;
  static constexpr double kNaturalRateLow = 0.15;   // blinks per second
  static constexpr double kNaturalRateHigh = 0.40;
  static constexpr double kOpenEyeLow = 0.12;
  static constexpr double kOpenEyeHigh = 0.38;
  static constexpr double kMinEarStd = 0.008;
  static constexpr double kFallbackFps = 30.0;

  /// Blinks in EAR samples ordered by time.
  [[nodiscard]] static std::size_t count_blinks(std::span<const double> ear);

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
