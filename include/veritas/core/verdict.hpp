#pragma once

#include <veritas/core/escalation_controller.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_result.hpp>
#include <cstdint>
#include <set>
#include <string_view>
#include <vector>

namespace veritas::core {

enum class Decision : std::uint8_t {
  Genuine,
  Suspicious,
  Deepfake,
};

[[nodiscard]] std::string_view to_string(Decision decision) noexcept;

/// Final, immutable outcome of one video run; owned by the caller.
/// Field names and types are the contract external report generators read.
struct Verdict {
  double probability{0.0};
  std::set<LevelId> triggered_flags;
  /// Always kLevelCount entries in level order 1..6; levels that never ran
  /// have status NotRun.
  std::vector<LevelResult> level_results;
  Decision decision{Decision::Genuine};

  EscalationReason reason{EscalationReason::AllLevelsExhausted};
  std::vector<LevelId> levels_run;
};

}  // namespace veritas::core
