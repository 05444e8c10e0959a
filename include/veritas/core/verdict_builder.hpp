#pragma once

#include <veritas/core/escalation_controller.hpp>
#include <veritas/core/fusion_engine.hpp>
#include <veritas/core/level_result.hpp>
#include <veritas/core/verdict.hpp>
#include <span>

namespace veritas::core {

/// Assembles a Verdict. Results are placed by level (1..6) whatever order
/// they arrive in; missing levels become NotRun entries. Each evaluated
/// level's detail gains its "effective_weight" from the fusion outcome.
[[nodiscard]] Verdict build_verdict(const FusionOutcome& fusion,
                                    Decision decision,
                                    const EscalationState& state,
                                    std::span<const LevelResult> level_results);

}  // namespace veritas::core
