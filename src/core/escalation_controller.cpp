#include <veritas/core/escalation_controller.hpp>
#include <string>

namespace veritas::core {

std::string_view to_string(EscalationReason reason) noexcept {
  switch (reason) {
    case EscalationReason::ConfidentGenuine:
      return "CONFIDENT_GENUINE";
    case EscalationReason::ConfidentFake:
      return "CONFIDENT_FAKE";
    case EscalationReason::AllLevelsExhausted:
      return "ALL_LEVELS_EXHAUSTED";
  }
  return "UNKNOWN";
}

EscalationPolicy EscalationPolicy::from_config(const FusionConfig& config) {
  EscalationPolicy p;
  p.high_confidence_fake_threshold = config.high_confidence_fake_threshold;
  p.minimum_support = config.minimum_support;
  p.max_consecutive_failures = config.max_consecutive_failures;
  return p;
}

EscalationController::EscalationController(EscalationPolicy policy)
    : policy_(policy) {
  results_.reserve(kLevelCount);
  state_.levels_run.reserve(kLevelCount);
}

std::optional<LevelId> EscalationController::current_level() const noexcept {
  if (phase_ == EscalationPhase::Done || next_index_ >= kLevelCount) {
    return std::nullopt;
  }
  return level_at(next_index_);
}

std::expected<LevelId, FusionError> EscalationController::begin_level() {
  if (phase_ != EscalationPhase::Pending) {
    return std::unexpected(FusionError::InvalidInput);
  }
  phase_ = EscalationPhase::Running;
  return level_at(next_index_);
}

std::expected<EscalationPhase, FusionError> EscalationController::complete_level(
    LevelResult result) {
  if (phase_ != EscalationPhase::Running || result.level != level_at(next_index_)) {
    return std::unexpected(FusionError::InvalidInput);
  }
  if (result.status == LevelStatus::ExtractionFailed) {
    ++consecutive_failures_;
  } else {
    consecutive_failures_ = 0;
  }
  if (!result.has_evidence()) {
    result.detail.notes.push_back("inconclusive_level_skipped");
  }
  if (consecutive_failures_ >= policy_.max_consecutive_failures) {
    state_.levels_run.push_back(result.level);
    results_.push_back(std::move(result));
    phase_ = EscalationPhase::Done;
    failed_ = true;
    return std::unexpected(FusionError::PipelineFailed);
  }
  return advance_after(results_.emplace_back(std::move(result)));
}

std::expected<EscalationPhase, FusionError> EscalationController::fail_level(
    FusionError error,
    std::string_view reason) {
  if (phase_ != EscalationPhase::Running) {
    return std::unexpected(FusionError::InvalidInput);
  }
  std::string note = std::string(to_string(error));
  if (!reason.empty()) {
    note += ": ";
    note += reason;
  }
  return complete_level(LevelResult::without_evidence(
      level_at(next_index_), LevelStatus::ExtractionFailed, std::move(note)));
}

EscalationPhase EscalationController::advance_after(const LevelResult& result) {
  state_.levels_run.push_back(result.level);

  const bool confident_fake = result.has_evidence() &&
                              *result.score >= policy_.high_confidence_fake_threshold &&
                              result.support >= policy_.minimum_support;
  if (confident_fake) {
    state_.conclusive = true;
    state_.reason = EscalationReason::ConfidentFake;
    phase_ = EscalationPhase::Done;
    return phase_;
  }

  ++next_index_;
  if (next_index_ >= kLevelCount) {
    state_.conclusive = true;
    state_.reason = EscalationReason::AllLevelsExhausted;
    phase_ = EscalationPhase::Done;
    return phase_;
  }
  phase_ = EscalationPhase::Pending;
  return phase_;
}

}  // namespace veritas::core
