#pragma once

#include <veritas/core/level.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veritas::core {

/// How a level's result came to be.
enum class LevelStatus : std::uint8_t {
  Evaluated,             // support > 0, score defined
  InsufficientEvidence,  // ran, but no usable frames
  ExtractionFailed,      // extractor or evaluator rejected the input
  NotRun,                // escalation stopped before this level
};

[[nodiscard]] std::string_view to_string(LevelStatus status) noexcept;

/// Audit trail for one level. reasons explain a suspicious flag; notes record
/// non-fatal anomalies (dropped frames, extraction errors).
struct LevelDetail {
  std::map<std::string, double> metrics;
  std::vector<std::string> reasons;
  std::vector<std::string> notes;
};

/// Standardized outcome of one level. score is nullopt ("insufficient evidence")
/// whenever support == 0, so an empty level never reads as "genuine".
struct LevelResult {
  LevelId level{LevelId::Expression};
  LevelStatus status{LevelStatus::NotRun};
  std::optional<double> score;  // [0,1], grows with anomaly strength
  bool suspicious{false};
  std::size_t support{0};
  LevelDetail detail;

  /// A NaN or infinite score is never evidence.
  [[nodiscard]] bool has_evidence() const noexcept {
    return support > 0 && score.has_value() && std::isfinite(*score);
  }

  /// Placeholder for a level that produced no evidence.
  [[nodiscard]] static LevelResult without_evidence(LevelId level,
                                                    LevelStatus status,
                                                    std::string note) {
    LevelResult r;
    r.level = level;
    r.status = status;
    if (!note.empty()) r.detail.notes.push_back(std::move(note));
    return r;
  }
};

}  // namespace veritas::core
