#pragma once

#include <veritas/core/level.hpp>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace veritas::core {

/// One analyzed unit (frame or audio segment) emitted by an external extractor.
/// Metric keys are level specific, e.g. "EAR" (blink), "yaw" (head pose),
/// "hf_ratio" (texture), "hue_delta" (color), "MAR" (lipsync).
struct FrameFeatureRecord {
  std::uint64_t frame_index{0};
  double timestamp{0.0};  // seconds
  LevelId level{LevelId::Expression};
  std::map<std::string, double> raw_metrics;

  /// Metric value if present and finite; NaN / infinite values count as missing.
  [[nodiscard]] std::optional<double> metric(const std::string& key) const {
    const auto it = raw_metrics.find(key);
    if (it == raw_metrics.end() || !std::isfinite(it->second)) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] bool has_metric(const std::string& key) const {
    return metric(key).has_value();
  }
};

}  // namespace veritas::core
