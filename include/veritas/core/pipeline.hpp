#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/feature_source.hpp>
#include <veritas/core/fusion_config.hpp>
#include <veritas/core/fusion_engine.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_evaluator.hpp>
#include <veritas/core/verdict.hpp>
#include <array>
#include <expected>
#include <functional>
#include <memory>

namespace veritas::core {

/// Callback for per-level timing: (level, duration_ms). Optional; pass to run().
using LevelTimingCallback = std::function<void(LevelId level, double duration_ms)>;

/// One evaluator per level, indexed by level_index().
using LevelEvaluatorSet = std::array<std::unique_ptr<ILevelEvaluator>, kLevelCount>;

/// Runs the escalation loop for one video and fuses the result.
///
/// Per run: pull level k from the source, evaluate it, feed the controller,
/// stop on a conclusive state; then fuse and build the Verdict. Extraction
/// errors stay local to their level until the consecutive-failure limit.
class AnalysisPipeline {
 public:
  /// Fails fast with InvalidConfig on a bad config, a missing evaluator or an
  /// evaluator placed in the wrong level slot.
  [[nodiscard]] static std::expected<AnalysisPipeline, FusionError> create(
      FusionConfig config,
      LevelEvaluatorSet evaluators);

  /// Analyze one video. PipelineFailed or InsufficientEvidence yield no Verdict.
  /// If timing_cb is non-null, it is called after each level with (level, duration_ms).
  /// Thread-safe: the pipeline holds only read-only state, so run() may be
  /// called from multiple threads with distinct sources.
  [[nodiscard]] std::expected<Verdict, FusionError> run(
      ILevelFeatureSource& source,
      LevelTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const FusionConfig& config() const noexcept { return config_; }
  [[nodiscard]] const FusionEngine& fusion_engine() const noexcept { return fusion_; }

 private:
  AnalysisPipeline(FusionConfig config, LevelEvaluatorSet evaluators);

  FusionConfig config_;
  LevelEvaluatorSet evaluators_;
  FusionEngine fusion_;
};

}  // namespace veritas::core
