#include <veritas/levels/evaluator_factory.hpp>
#include <veritas/levels/blink_evaluator.hpp>
#include <veritas/levels/color_evaluator.hpp>
#include <veritas/levels/expression_evaluator.hpp>
#include <veritas/levels/headpose_evaluator.hpp>
#include <veritas/levels/lipsync_evaluator.hpp>
#include <veritas/levels/texture_evaluator.hpp>
#include <memory>

namespace veritas::levels {

namespace vc = veritas::core;

vc::LevelEvaluatorSet make_level_evaluators(const vc::FusionConfig& config) {
  using vc::EvaluatorSettings;
  using vc::LevelId;

  vc::LevelEvaluatorSet set;
  set[vc::level_index(LevelId::Expression)] = std::make_unique<ExpressionEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::Expression));
  set[vc::level_index(LevelId::Blink)] = std::make_unique<BlinkEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::Blink));
  set[vc::level_index(LevelId::HeadPose)] = std::make_unique<HeadPoseEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::HeadPose));
  set[vc::level_index(LevelId::Texture)] = std::make_unique<TextureEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::Texture));
  set[vc::level_index(LevelId::Color)] = std::make_unique<ColorEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::Color));
  set[vc::level_index(LevelId::LipSync)] = std::make_unique<LipSyncEvaluator>(
      EvaluatorSettings::for_level(config, LevelId::LipSync));
  return set;
}

std::expected<vc::AnalysisPipeline, vc::FusionError> make_default_pipeline(
    vc::FusionConfig config) {
  auto evaluators = make_level_evaluators(config);
  return vc::AnalysisPipeline::create(std::move(config), std::move(evaluators));
}

}  // namespace veritas::levels
