#include <veritas/core/fusion_config.hpp>
#include <cmath>

namespace veritas::core {

namespace {

bool is_unit_interval(double v) {
  return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

}  // namespace

std::expected<void, FusionError> validate_config(const FusionConfig& config) {
  double sum = 0.0;
  for (const double w : config.weights) {
    if (!std::isfinite(w) || w < 0.0) {
      return std::unexpected(FusionError::InvalidConfig);
    }
    sum += w;
  }
  if (std::abs(sum - 1.0) > kWeightSumTolerance) {
    return std::unexpected(FusionError::InvalidConfig);
  }

  if (!is_unit_interval(config.high_confidence_fake_threshold)) {
    return std::unexpected(FusionError::InvalidConfig);
  }
  for (const double t : config.anomaly_thresholds) {
    if (!is_unit_interval(t)) return std::unexpected(FusionError::InvalidConfig);
  }

  const auto& d = config.decision_thresholds;
  if (!is_unit_interval(d.suspicious_low) || !is_unit_interval(d.deepfake_low) ||
      d.suspicious_low > d.deepfake_low) {
    return std::unexpected(FusionError::InvalidConfig);
  }

  if (config.max_consecutive_failures == 0) {
    return std::unexpected(FusionError::InvalidConfig);
  }
  if (config.aggregation_window.has_value() && *config.aggregation_window == 0) {
    return std::unexpected(FusionError::InvalidConfig);
  }
  return {};
}

}  // namespace veritas::core
