#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/fusion_config.hpp>
#include <veritas/core/pipeline.hpp>
#include <expected>

namespace veritas::levels {

/// The six built-in evaluators, configured from \p config.
[[nodiscard]] veritas::core::LevelEvaluatorSet make_level_evaluators(
    const veritas::core::FusionConfig& config);

/// Pipeline with the built-in evaluators; InvalidConfig on a bad config.
[[nodiscard]] std::expected<veritas::core::AnalysisPipeline, veritas::core::FusionError>
make_default_pipeline(veritas::core::FusionConfig config = {});

}  // namespace veritas::levels
