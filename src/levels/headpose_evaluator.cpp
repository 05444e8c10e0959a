#include <veritas/levels/headpose_evaluator.hpp>
#include "signal_math.hpp"
#include <cmath>

namespace veritas::levels {

namespace vc = veritas::core;

HeadPoseEvaluator::HeadPoseEvaluator(vc::EvaluatorSettings settings)
    : LevelEvaluator(vc::LevelId::HeadPose, std::move(settings)) {}

bool HeadPoseEvaluator::usable(const vc::FrameFeatureRecord& record) const {
  return record.has_metric("yaw") && record.has_metric("pitch") &&
         record.has_metric("roll") && record.has_metric("expected_disp") &&
         record.has_metric("observed_disp");
}

std::vector<double> HeadPoseEvaluator::frame_scores(
    std::span<const vc::FrameFeatureRecord> frames) const {
  std::vector<double> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    const double e = *f.metric("expected_disp");
    const double o = *f.metric("observed_disp");
    const double denom = std::abs(e) + std::abs(o);
    out.push_back(denom > 1e-12 ? std::abs(e - o) / denom : 0.0);
  }
  return out;
}

double HeadPoseEvaluator::level_score(
    std::span<const vc::FrameFeatureRecord> frames,
    std::span<const double> /*scores*/,
    const vc::AggregateStats& stats,
    vc::LevelDetail& detail) const {
  std::vector<double> expected;
  std::vector<double> observed;
  std::vector<double> yaw;
  std::vector<double> pitch;
  std::vector<double> roll;
  for (const auto& f : frames) {
    expected.push_back(*f.metric("expected_disp"));
    observed.push_back(*f.metric("observed_disp"));
    yaw.push_back(*f.metric("yaw"));
    pitch.push_back(*f.metric("pitch"));
    roll.push_back(*f.metric("roll"));
  }

  double correlation_anomaly = stats.mean.value_or(0.0);
  if (const auto r = math::pearson(expected, observed)) {
    correlation_anomaly = 1.0 - std::abs(*r);
    detail.metrics["pose_correlation"] = *r;
  } else {
    detail.notes.push_back("pose_correlation_undefined");
  }

  // Angular speed between consecutive frames.
  std::vector<double> speed;
  for (std::size_t i = 1; i < frames.size(); ++i) {
    const double dy = yaw[i] - yaw[i - 1];
    const double dp = pitch[i] - pitch[i - 1];
    const double dr = roll[i] - roll[i - 1];
    speed.push_back(std::sqrt(dy * dy + dp * dp + dr * dr));
  }

  bool motion_flag = false;
  if (speed.size() >= 2) {
    const double sd = math::stddev_of(speed);
    const double speed_variance = sd * sd;
    detail.metrics["speed_variance"] = speed_variance;
    detail.metrics["mean_speed"] = math::mean_of(speed);
    if (speed_variance < kSmoothSpeedVariance) {
      detail.reasons.push_back("too_smooth_motion");
      motion_flag = true;
    } else if (speed_variance > kJitterSpeedVariance) {
      detail.reasons.push_back("jittery_motion");
      motion_flag = true;
    }
  }
  const double sy = math::stddev_of(yaw);
  const double sp = math::stddev_of(pitch);
  const double sr = math::stddev_of(roll);
  detail.metrics["pose_variance"] = sy * sy + sp * sp + sr * sr;

  return 0.7 * correlation_anomaly + (motion_flag ? 0.3 : 0.0);
}

}  // namespace veritas::levels
