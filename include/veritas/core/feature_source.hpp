#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/frame_feature_record.hpp>
#include <veritas/core/level.hpp>
#include <expected>
#include <string>
#include <vector>

namespace veritas::core {

/// Supplies one video's FrameFeatureRecords, one level at a time.
/// The pipeline pulls a level only when escalation reaches it, so expensive
/// extractors (lipsync) never run when an earlier level is conclusive.
/// One source per video run; extract() is not called concurrently.
class ILevelFeatureSource {
 public:
  virtual ~ILevelFeatureSource() = default;

  /// Records for \p level, any order. ExtractionError when the extractor
  /// failed; an empty vector means it ran but found nothing to analyze.
  [[nodiscard]] virtual std::expected<std::vector<FrameFeatureRecord>, FusionError>
  extract(LevelId level) = 0;

  /// Optional: human-readable cause of the last failed extract(level). Default: empty.
  [[nodiscard]] virtual std::string failure_reason(LevelId /*level*/) const {
    return {};
  }
};

}  // namespace veritas::core
