#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/fusion_config.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veritas::core {

/// Why escalation stopped.
enum class EscalationReason : std::uint8_t {
  ConfidentGenuine,  // reserved for reports; the asymmetric rule never stops on genuine evidence
  ConfidentFake,
  AllLevelsExhausted,
};

[[nodiscard]] std::string_view to_string(EscalationReason reason) noexcept;

enum class EscalationPhase : std::uint8_t {
  Pending,  // next level waiting to run
  Running,  // current level being extracted / evaluated
  Done,
};

/// Which levels ran and whether the run is conclusive.
struct EscalationState {
  std::vector<LevelId> levels_run;  // strictly increasing
  bool conclusive{false};
  std::optional<EscalationReason> reason;  // set once conclusive
};

/// Stop rule parameters, taken from FusionConfig.
struct EscalationPolicy {
  double high_confidence_fake_threshold{0.85};
  std::size_t minimum_support{10};
  std::size_t max_consecutive_failures{3};

  [[nodiscard]] static EscalationPolicy from_config(const FusionConfig& config);
};

/// Sequential state machine over levels 1 -> 6.
///
/// PENDING(k) --begin_level--> RUNNING(k) --complete_level/fail_level-->
/// PENDING(k+1) or DONE. Escalation is asymmetric: a level with
/// score >= high_confidence_fake_threshold and support >= minimum_support stops
/// the run (ConfidentFake); weak or absent evidence always moves on, since a
/// deepfake may mimic the basic signals. Level 6 always ends the run.
/// A level that fails extraction is recorded with support 0 and skipped;
/// max_consecutive_failures failures in a row abort with PipelineFailed.
///
/// One controller per video run; not shared between threads.
class EscalationController {
 public:
  explicit EscalationController(EscalationPolicy policy = {});

  [[nodiscard]] EscalationPhase phase() const noexcept { return phase_; }

  /// Level that is pending or running; nullopt once Done.
  [[nodiscard]] std::optional<LevelId> current_level() const noexcept;

  /// PENDING -> RUNNING. Returns the level to run, InvalidInput if not pending.
  [[nodiscard]] std::expected<LevelId, FusionError> begin_level();

  /// RUNNING -> PENDING/DONE with the level's result. InvalidInput if not
  /// running or the result is for another level.
  [[nodiscard]] std::expected<EscalationPhase, FusionError> complete_level(
      LevelResult result);

  /// RUNNING -> PENDING/DONE after an extraction error. Records a support-0
  /// result tagged with \p reason. Returns PipelineFailed once the consecutive
  /// failure limit is reached (the controller is then Done and failed()).
  [[nodiscard]] std::expected<EscalationPhase, FusionError> fail_level(
      FusionError error,
      std::string_view reason = {});

  [[nodiscard]] const EscalationState& state() const noexcept { return state_; }
  [[nodiscard]] bool failed() const noexcept { return failed_; }
  [[nodiscard]] std::size_t consecutive_failures() const noexcept {
    return consecutive_failures_;
  }

  /// Results of the levels that ran, in run order.
  [[nodiscard]] const std::vector<LevelResult>& results() const noexcept {
    return results_;
  }

 private:
  EscalationPhase advance_after(const LevelResult& result);

  EscalationPolicy policy_;
  EscalationPhase phase_{EscalationPhase::Pending};
  std::size_t next_index_{0};
  EscalationState state_;
  std::vector<LevelResult> results_;
  std::size_t consecutive_failures_{0};
  bool failed_{false};
};

}  // namespace veritas::core
