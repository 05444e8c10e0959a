#include <veritas/core/pipeline.hpp>
#include <veritas/core/escalation_controller.hpp>
#include <veritas/core/verdict_builder.hpp>
#include <chrono>
#include <utility>

namespace veritas::core {

AnalysisPipeline::AnalysisPipeline(FusionConfig config, LevelEvaluatorSet evaluators)
    : config_(std::move(config)),
      evaluators_(std::move(evaluators)),
      fusion_(config_.weights, config_.decision_thresholds) {}

std::expected<AnalysisPipeline, FusionError> AnalysisPipeline::create(
    FusionConfig config,
    LevelEvaluatorSet evaluators) {
  auto valid = validate_config(config);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  for (std::size_t i = 0; i < kLevelCount; ++i) {
    if (!evaluators[i] || evaluators[i]->level() != level_at(i)) {
      return std::unexpected(FusionError::InvalidConfig);
    }
  }
  return AnalysisPipeline(std::move(config), std::move(evaluators));
}

std::expected<Verdict, FusionError> AnalysisPipeline::run(
    ILevelFeatureSource& source,
    LevelTimingCallback* timing_cb) const {
  EscalationController controller(EscalationPolicy::from_config(config_));

  while (controller.phase() != EscalationPhase::Done) {
    auto level = controller.begin_level();
    if (!level) {
      return std::unexpected(level.error());
    }

    const auto level_start = std::chrono::steady_clock::now();
    auto step = [&]() -> std::expected<EscalationPhase, FusionError> {
      auto records = source.extract(*level);
      if (!records) {
        return controller.fail_level(records.error(), source.failure_reason(*level));
      }
      auto result = evaluators_[level_index(*level)]->evaluate(*level, *records);
      if (!result) {
        return controller.fail_level(result.error(), "records rejected by evaluator");
      }
      return controller.complete_level(std::move(*result));
    }();
    if (timing_cb) {
      const auto level_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(level_end - level_start).count());
      (*timing_cb)(*level, ms);
    }

    if (!step) {
      return std::unexpected(step.error());
    }
  }

  auto fused = fusion_.fuse(controller.results());
  if (!fused) {
    return std::unexpected(fused.error());
  }
  return build_verdict(*fused, fusion_.decide(fused->probability),
                       controller.state(), controller.results());
}

}  // namespace veritas::core
