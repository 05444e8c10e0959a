#include <veritas/core/verdict_builder.hpp>

namespace veritas::core {

Verdict build_verdict(const FusionOutcome& fusion,
                      Decision decision,
                      const EscalationState& state,
                      std::span<const LevelResult> level_results) {
  Verdict v;
  v.probability = fusion.probability;
  v.triggered_flags = fusion.triggered_flags;
  v.decision = decision;
  v.reason = state.reason.value_or(EscalationReason::AllLevelsExhausted);
  v.levels_run = state.levels_run;

  v.level_results.reserve(kLevelCount);
  for (const LevelId level : kAllLevels) {
    v.level_results.push_back(
        LevelResult::without_evidence(level, LevelStatus::NotRun, {}));
  }
  for (const auto& r : level_results) {
    LevelResult& slot = v.level_results[level_index(r.level)];
    slot = r;
    if (slot.has_evidence()) {
      slot.detail.metrics["effective_weight"] =
          fusion.effective_weights[level_index(r.level)];
    }
  }
  return v;
}

}  // namespace veritas::core
