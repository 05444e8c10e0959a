#pragma once

#include <veritas/core/feature_source.hpp>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace veritas::core {

/// Feature source returning preset records or failures per level (for tests/demo).
class MockFeatureSource : public ILevelFeatureSource {
 public:
  /// Records to return for \p level; clears a preset failure.
  void set_records(LevelId level, std::vector<FrameFeatureRecord> records);

  /// Make extract(level) fail with ExtractionError.
  void set_failure(LevelId level, std::string reason);

  [[nodiscard]] std::expected<std::vector<FrameFeatureRecord>, FusionError>
  extract(LevelId level) override;

  [[nodiscard]] std::string failure_reason(LevelId level) const override;

  /// Number of extract() calls made for \p level.
  [[nodiscard]] std::size_t extract_calls(LevelId level) const noexcept {
    return calls_[level_index(level)];
  }

 private:
  std::array<std::vector<FrameFeatureRecord>, kLevelCount> records_{};
  std::array<std::optional<std::string>, kLevelCount> failures_{};
  std::array<std::size_t, kLevelCount> calls_{};
};

/// Builds \p count records for \p level (frame_index 0.., timestamp index / fps)
/// all carrying \p metrics.
[[nodiscard]] std::vector<FrameFeatureRecord> make_uniform_records(
    LevelId level,
    std::size_t count,
    const std::map<std::string, double>& metrics,
    double fps = 30.0);

}  // namespace veritas::core
