#include <veritas/core/fusion_engine.hpp>
#include <algorithm>
#include <bitset>
#include <cmath>

namespace veritas::core {

Decision decide(double probability, const DecisionThresholds& thresholds) noexcept {
  if (probability < thresholds.suspicious_low) return Decision::Genuine;
  if (probability < thresholds.deepfake_low) return Decision::Suspicious;
  return Decision::Deepfake;
}

std::string_view to_string(Decision decision) noexcept {
  switch (decision) {
    case Decision::Genuine:
      return "GENUINE";
    case Decision::Suspicious:
      return "SUSPICIOUS";
    case Decision::Deepfake:
      return "DEEPFAKE";
  }
  return "UNKNOWN";
}

FusionEngine::FusionEngine(LevelWeights weights, DecisionThresholds thresholds)
    : weights_(weights), thresholds_(thresholds) {}

Decision FusionEngine::decide(double probability) const noexcept {
  return core::decide(probability, thresholds_);
}

std::expected<FusionOutcome, FusionError> FusionEngine::fuse(
    std::span<const LevelResult> level_results) const {
  FusionOutcome out;
  std::bitset<kLevelCount> seen;
  std::bitset<kLevelCount> supported;
  LevelWeights scores{};

  for (const auto& r : level_results) {
    const std::size_t idx = level_index(r.level);
    if (seen.test(idx)) {
      return std::unexpected(FusionError::InvalidInput);
    }
    seen.set(idx);
    if (r.suspicious) out.triggered_flags.insert(r.level);
    if (r.has_evidence()) {
      supported.set(idx);
      scores[idx] = std::clamp(*r.score, 0.0, 1.0);
    }
  }
  if (supported.none()) {
    return std::unexpected(FusionError::InsufficientEvidence);
  }

  LevelWeights raw{};
  double total = 0.0;
  for (std::size_t i = 0; i < kLevelCount; ++i) {
    if (supported.test(i)) {
      raw[i] = weights_[i];
      total += raw[i];
    }
  }
  if (total <= 0.0) {
    // Every participating level is weighted 0: share equally.
    for (std::size_t i = 0; i < kLevelCount; ++i) {
      raw[i] = supported.test(i) ? 1.0 : 0.0;
    }
    total = static_cast<double>(supported.count());
  }

  double weighted_sum = 0.0;
  for (std::size_t i = 0; i < kLevelCount; ++i) {
    weighted_sum += raw[i] * scores[i];
    out.effective_weights[i] = raw[i] / total;
  }
  out.probability = std::clamp(weighted_sum / total, 0.0, 1.0);

  double spread = 0.0;
  for (std::size_t i = 0; i < kLevelCount; ++i) {
    const double d = scores[i] - out.probability;
    spread += out.effective_weights[i] * d * d;
  }
  out.disagreement = std::sqrt(spread);
  return out;
}

}  // namespace veritas::core
