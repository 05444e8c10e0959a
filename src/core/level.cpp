#include <veritas/core/error.hpp>
#include <veritas/core/level.hpp>
#include <veritas/core/level_result.hpp>

namespace veritas::core {

std::string_view to_string(LevelId level) noexcept {
  switch (level) {
    case LevelId::Expression:
      return "expression";
    case LevelId::Blink:
      return "blink";
    case LevelId::HeadPose:
      return "headpose";
    case LevelId::Texture:
      return "texture";
    case LevelId::Color:
      return "color";
    case LevelId::LipSync:
      return "lipsync";
  }
  return "unknown";
}

std::optional<LevelId> parse_level(std::string_view text) noexcept {
  if (text.size() == 1 && text[0] >= '1' && text[0] <= '6') {
    return level_at(static_cast<std::size_t>(text[0] - '1'));
  }
  for (const LevelId level : kAllLevels) {
    if (to_string(level) == text) return level;
  }
  return std::nullopt;
}

std::string_view to_string(LevelStatus status) noexcept {
  switch (status) {
    case LevelStatus::Evaluated:
      return "evaluated";
    case LevelStatus::InsufficientEvidence:
      return "insufficient_evidence";
    case LevelStatus::ExtractionFailed:
      return "extraction_failed";
    case LevelStatus::NotRun:
      return "not_run";
  }
  return "unknown";
}

std::string_view to_string(FusionError error) noexcept {
  switch (error) {
    case FusionError::None:
      return "none";
    case FusionError::ExtractionError:
      return "extraction_error";
    case FusionError::PipelineFailed:
      return "pipeline_failed";
    case FusionError::InsufficientEvidence:
      return "insufficient_evidence";
    case FusionError::InvalidConfig:
      return "config_invalid";
    case FusionError::InvalidInput:
      return "invalid_input";
  }
  return "unknown";
}

}  // namespace veritas::core
