#include <veritas/core/frame_feature_record.hpp>
#include <veritas/levels/headpose_evaluator.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace vc = veritas::core;
namespace vl = veritas::levels;

namespace {

/// yaw(i) drives the motion; observed(expected, i) the displacement match.
std::vector<vc::FrameFeatureRecord> poses(std::size_t n,
                                          const std::function<double(std::size_t)>& yaw,
                                          const std::function<double(double, std::size_t)>& observed) {
  std::vector<vc::FrameFeatureRecord> out;
  for (std::size_t i = 0; i < n; ++i) {
    const double expected = 1.0 + 0.5 * std::sin(static_cast<double>(i) / 5.0);
    vc::FrameFeatureRecord r;
    r.frame_index = i;
    r.timestamp = static_cast<double>(i) / 30.0;
    r.level = vc::LevelId::HeadPose;
    r.raw_metrics = {{"yaw", yaw(i)},
                     {"pitch", 0.0},
                     {"roll", 0.0},
                     {"expected_disp", expected},
                     {"observed_disp", observed(expected, i)}};
    out.push_back(std::move(r));
  }
  return out;
}

double natural_yaw(std::size_t i) {
  return 0.5 * static_cast<double>(i) + ((i % 2) ? 0.05 : 0.0);
}

double matching(double expected, std::size_t) { return expected; }

bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

TEST(HeadPoseEvaluator, ConsistentPoseAndNaturalMotionScoresLow) {
  vl::HeadPoseEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::HeadPose, poses(60, natural_yaw, matching));
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->score.has_value());
  EXPECT_NEAR(*r->score, 0.0, 1e-9);
  EXPECT_FALSE(r->suspicious);
  EXPECT_NEAR(r->detail.metrics.at("pose_correlation"), 1.0, 1e-9);
  EXPECT_NEAR(r->detail.metrics.at("speed_variance"), 0.0025, 1e-5);
}

TEST(HeadPoseEvaluator, PerfectlyUniformMotionIsTooSmooth) {
  vl::HeadPoseEvaluator eval;
  auto uniform = [](std::size_t i) { return 0.5 * static_cast<double>(i); };
  auto r = eval.evaluate(vc::LevelId::HeadPose, poses(60, uniform, matching));
  ASSERT_TRUE(r.has_value());
  EXPECT_NEAR(*r->score, 0.3, 1e-9);
  EXPECT_TRUE(has(r->detail.reasons, "too_smooth_motion"));
  EXPECT_TRUE(r->suspicious);
}

TEST(HeadPoseEvaluator, JitteryMotionFlagged) {
  vl::HeadPoseEvaluator eval;
  auto jitter = [](std::size_t i) { return (i % 3 == 0) ? 4.0 : 0.0; };
  auto r = eval.evaluate(vc::LevelId::HeadPose, poses(60, jitter, matching));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(has(r->detail.reasons, "jittery_motion"));
}

TEST(HeadPoseEvaluator, MismatchedDisplacementScoresHigh) {
  vl::HeadPoseEvaluator eval;
  auto flipped = [](double expected, std::size_t) { return 2.0 - expected; };
  auto r = eval.evaluate(vc::LevelId::HeadPose, poses(60, natural_yaw, flipped));
  ASSERT_TRUE(r.has_value());
  // Perfect anti-correlation still tracks the pose; per-frame mismatch is visible.
  EXPECT_NEAR(r->detail.metrics.at("pose_correlation"), -1.0, 1e-9);
  EXPECT_GT(r->detail.metrics.at("frame_mean"), 0.0);
}

TEST(HeadPoseEvaluator, FlatObservedSignalFallsBackToFrameMean) {
  vl::HeadPoseEvaluator eval;
  auto frozen = [](double, std::size_t) { return 1.0; };
  auto r = eval.evaluate(vc::LevelId::HeadPose, poses(60, natural_yaw, frozen));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(has(r->detail.notes, "pose_correlation_undefined"));
  EXPECT_EQ(r->detail.metrics.count("pose_correlation"), 0u);
  EXPECT_NEAR(*r->score, 0.7 * r->detail.metrics.at("frame_mean"), 1e-9);
}

TEST(HeadPoseEvaluator, RequiresAllPoseMetrics) {
  auto records = poses(12, natural_yaw, matching);
  records[0].raw_metrics.erase("roll");
  vl::HeadPoseEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::HeadPose, records);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->support, 11u);
}

TEST(HeadPoseEvaluator, OverflowingDisplacementsGiveNoEvidence) {
  vl::HeadPoseEvaluator eval;
  auto records = poses(20, natural_yaw, matching);
  for (std::size_t i = 0; i < records.size(); ++i) {
    const double big = (i % 2) ? 1e308 : -1e308;
    records[i].raw_metrics["expected_disp"] = big;
    records[i].raw_metrics["observed_disp"] = -big;
  }
  auto r = eval.evaluate(vc::LevelId::HeadPose, records);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, vc::LevelStatus::InsufficientEvidence);
  EXPECT_FALSE(r->score.has_value());
  EXPECT_EQ(r->support, 0u);
  EXPECT_FALSE(r->has_evidence());
  EXPECT_DOUBLE_EQ(r->detail.metrics.at("dropped_frames"), 20.0);
}

TEST(HeadPoseEvaluator, HugeDisplacementsLeaveCorrelationUndefined) {
  vl::HeadPoseEvaluator eval;
  auto records = poses(40, natural_yaw, matching);
  for (auto& r : records) {
    r.raw_metrics["expected_disp"] *= 1e300;
    r.raw_metrics["observed_disp"] *= 1e300;
  }
  auto r = eval.evaluate(vc::LevelId::HeadPose, records);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->score.has_value());
  EXPECT_TRUE(std::isfinite(*r->score));
  EXPECT_GE(*r->score, 0.0);
  EXPECT_LE(*r->score, 1.0);
  EXPECT_EQ(r->support, 40u);
  EXPECT_TRUE(has(r->detail.notes, "pose_correlation_undefined"));
  EXPECT_EQ(r->detail.metrics.count("pose_correlation"), 0u);
}
