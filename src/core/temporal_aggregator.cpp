#include <veritas/core/temporal_aggregator.hpp>
#include <algorithm>

namespace veritas::core {

namespace {

struct Moments {
  double mean{0.0};
  double variance{0.0};
  double rate{0.0};
};

Moments moments_of(std::span<const double> values, double threshold) {
  Moments m;
  double sum = 0.0;
  std::size_t above = 0;
  for (const double v : values) {
    sum += v;
    if (v > threshold) ++above;
  }
  const double n = static_cast<double>(values.size());
  m.mean = sum / n;
  double sq = 0.0;
  for (const double v : values) {
    const double d = v - m.mean;
    sq += d * d;
  }
  m.variance = sq / n;
  m.rate = static_cast<double>(above) / n;
  return m;
}

std::size_t longest_run_above(std::span<const double> values, double threshold) {
  std::size_t best = 0;
  std::size_t current = 0;
  for (const double v : values) {
    if (v > threshold) {
      best = std::max(best, ++current);
    } else {
      current = 0;
    }
  }
  return best;
}

}  // namespace

AggregateStats TemporalAggregator::aggregate(
    std::span<const double> scores,
    std::optional<std::size_t> window) const {
  AggregateStats stats;
  stats.count = scores.size();
  if (scores.empty()) return stats;

  stats.max_run_above_threshold = longest_run_above(scores, threshold_);

  const bool windowed = window.has_value() && *window > 0 && *window <= scores.size();
  std::span<const double> selected = scores;
  if (windowed) {
    const std::size_t w = *window;
    const std::size_t num_windows = scores.size() - w + 1;
    stats.window_means.reserve(num_windows);

    double running = 0.0;
    for (std::size_t i = 0; i < w; ++i) running += scores[i];
    stats.window_means.push_back(running / static_cast<double>(w));
    for (std::size_t start = 1; start < num_windows; ++start) {
      running += scores[start + w - 1] - scores[start - 1];
      stats.window_means.push_back(running / static_cast<double>(w));
    }

    const auto peak = std::max_element(stats.window_means.begin(), stats.window_means.end());
    const auto peak_start = static_cast<std::size_t>(peak - stats.window_means.begin());
    selected = scores.subspan(peak_start, w);
  }

  const Moments m = moments_of(selected, threshold_);
  stats.mean = m.mean;
  stats.variance = m.variance;
  stats.rate = m.rate;
  return stats;
}

}  // namespace veritas::core
