#include <veritas/core/frame_feature_record.hpp>
#include <veritas/levels/blink_evaluator.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace vc = veritas::core;
namespace vl = veritas::levels;

namespace {

std::vector<vc::FrameFeatureRecord> ear_series(const std::vector<double>& ear, double fps = 30.0) {
  std::vector<vc::FrameFeatureRecord> out;
  for (std::size_t i = 0; i < ear.size(); ++i) {
    vc::FrameFeatureRecord r;
    r.frame_index = i;
    r.timestamp = static_cast<double>(i) / fps;
    r.level = vc::LevelId::Blink;
    r.raw_metrics["EAR"] = ear[i];
    out.push_back(std::move(r));
  }
  return out;
}

/// 10 s of open eyes (EAR alternating 0.28 / 0.32) with three 3-frame blinks.
std::vector<double> natural_ear() {
  std::vector<double> ear(300);
  for (std::size_t i = 0; i < ear.size(); ++i) ear[i] = (i % 2) ? 0.32 : 0.28;
  for (const std::size_t start : {50u, 150u, 250u}) {
    for (std::size_t k = 0; k < 3; ++k) ear[start + k] = 0.1;
  }
  return ear;
}

bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

TEST(BlinkEvaluator, CountBlinksNeedsConsecutiveClosedFrames) {
  const std::vector<double> ear{0.3, 0.1, 0.1, 0.3, 0.1, 0.3, 0.3};
  EXPECT_EQ(vl::BlinkEvaluator::count_blinks(ear), 1u);
}

TEST(BlinkEvaluator, TrailingClosedRunIsNotCounted) {
  const std::vector<double> ear{0.3, 0.1, 0.1, 0.1};
  EXPECT_EQ(vl::BlinkEvaluator::count_blinks(ear), 0u);
}

TEST(BlinkEvaluator, NaturalBlinkingScoresZero) {
  vl::BlinkEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Blink, ear_series(natural_ear()));
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->score.has_value());
  EXPECT_DOUBLE_EQ(*r->score, 0.0);
  EXPECT_FALSE(r->suspicious);
  EXPECT_DOUBLE_EQ(r->detail.metrics.at("blink_count"), 3.0);
  EXPECT_NEAR(r->detail.metrics.at("blink_rate"), 3.0 / (299.0 / 30.0), 1e-9);
  EXPECT_EQ(r->support, 300u);
}

TEST(BlinkEvaluator, StaringWithoutBlinksIsSuspicious) {
  vl::BlinkEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Blink, ear_series(std::vector<double>(300, 0.3)));
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->score.has_value());
  EXPECT_NEAR(*r->score, 0.8, 1e-9);
  EXPECT_TRUE(r->suspicious);
  EXPECT_TRUE(has(r->detail.reasons, "low_blink_rate"));
  EXPECT_TRUE(has(r->detail.reasons, "low_ear_variance"));
  EXPECT_TRUE(has(r->detail.reasons, "high_anomaly_score"));
  EXPECT_FALSE(has(r->detail.reasons, "abnormal_ear"));
}

TEST(BlinkEvaluator, ExcessiveBlinkingFlagged) {
  std::vector<double> ear(90);
  for (std::size_t i = 0; i < ear.size(); ++i) ear[i] = (i % 6 < 2) ? 0.1 : 0.3;
  vl::BlinkEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Blink, ear_series(ear));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(has(r->detail.reasons, "high_blink_rate"));
  EXPECT_GT(*r->score, 0.5);
}

TEST(BlinkEvaluator, SingleFrameUsesFallbackDuration) {
  vl::BlinkEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Blink, ear_series({0.3}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->support, 1u);
  EXPECT_NEAR(r->detail.metrics.at("duration_s"), 1.0 / 30.0, 1e-12);
}

TEST(BlinkEvaluator, RecordsWithoutEarAreDropped) {
  auto records = ear_series(natural_ear());
  records[10].raw_metrics.clear();
  vl::BlinkEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Blink, records);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->support, 299u);
  EXPECT_DOUBLE_EQ(r->detail.metrics.at("dropped_frames"), 1.0);
}
