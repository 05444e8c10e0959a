#pragma once

#include <string_view>

namespace veritas::core {

/// Analysis error codes; used with std::expected for recoverable failures.
enum class FusionError {
  None = 0,
  ExtractionError,       // one level's input missing or malformed; recovered per level
  PipelineFailed,        // too many consecutive extraction errors; run aborted
  InsufficientEvidence,  // no level produced usable support
  InvalidConfig,
  InvalidInput,
};

[[nodiscard]] std::string_view to_string(FusionError error) noexcept;

}  // namespace veritas::core
