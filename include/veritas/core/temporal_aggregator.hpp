#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace veritas::core {

/// Per-video summary of a per-frame (or per-segment) score sequence.
/// All optionals are empty for an empty sequence.
struct AggregateStats {
  std::size_t count{0};
  std::optional<double> mean;
  std::optional<double> variance;  // population variance; 0 for one sample
  std::size_t max_run_above_threshold{0};
  std::optional<double> rate;      // share of samples above threshold
  /// Mean of every sliding window, in sequence order (windowed mode only).
  std::vector<double> window_means;
};

/// Reduces score sequences with a fixed anomaly threshold.
/// A run counts samples strictly above the threshold, so sustained artifacts
/// stand out from isolated spikes that averaging would mask.
class TemporalAggregator {
 public:
  explicit TemporalAggregator(double anomaly_threshold) noexcept
      : threshold_(anomaly_threshold) {}

  /// Full-sequence statistics, or with \p window (1 <= window <= size) the
  /// statistics of the highest-mean window; larger windows fall back to the
  /// full sequence. max_run_above_threshold always spans the whole sequence.
  [[nodiscard]] AggregateStats aggregate(
      std::span<const double> scores,
      std::optional<std::size_t> window = std::nullopt) const;

  [[nodiscard]] double threshold() const noexcept { return threshold_; }

 private:
  double threshold_;
};

}  // namespace veritas::core
