#include <veritas/app/dataset_evaluation.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <map>
#include <string>

namespace va = veritas::app;
namespace vc = veritas::core;

TEST(DatasetEvaluation, EmptyHasNoMetrics) {
  va::DatasetEvaluation e;
  auto m = e.metrics();
  EXPECT_FALSE(m.accuracy.has_value());
  EXPECT_FALSE(m.precision.has_value());
  EXPECT_FALSE(m.recall.has_value());
  EXPECT_FALSE(m.f1.has_value());
}

TEST(DatasetEvaluation, SuspiciousCountsAsFake) {
  va::DatasetEvaluation e;
  e.add(va::GroundTruth::Fake, vc::Decision::Suspicious);
  e.add(va::GroundTruth::Real, vc::Decision::Suspicious);
  EXPECT_EQ(e.matrix().true_positive, 1u);
  EXPECT_EQ(e.matrix().false_positive, 1u);
}

TEST(DatasetEvaluation, ConfusionMatrixMetrics) {
  va::DatasetEvaluation e;
  e.add(va::GroundTruth::Fake, vc::Decision::Deepfake);   // TP
  e.add(va::GroundTruth::Fake, vc::Decision::Deepfake);   // TP
  e.add(va::GroundTruth::Fake, vc::Decision::Genuine);    // FN
  e.add(va::GroundTruth::Real, vc::Decision::Genuine);    // TN
  e.add(va::GroundTruth::Real, vc::Decision::Genuine);    // TN
  e.add(va::GroundTruth::Real, vc::Decision::Suspicious); // FP
  e.add_error();

  const auto& c = e.matrix();
  EXPECT_EQ(c.true_positive, 2u);
  EXPECT_EQ(c.false_negative, 1u);
  EXPECT_EQ(c.true_negative, 2u);
  EXPECT_EQ(c.false_positive, 1u);
  EXPECT_EQ(c.total(), 6u);
  EXPECT_EQ(e.errors(), 1u);

  auto m = e.metrics();
  EXPECT_DOUBLE_EQ(*m.accuracy, 4.0 / 6.0);
  EXPECT_DOUBLE_EQ(*m.precision, 2.0 / 3.0);
  EXPECT_DOUBLE_EQ(*m.recall, 2.0 / 3.0);
  EXPECT_NEAR(*m.f1, 2.0 / 3.0, 1e-12);
}

TEST(DatasetEvaluation, NoPositivePredictionsLeavesPrecisionUndefined) {
  va::DatasetEvaluation e;
  e.add(va::GroundTruth::Real, vc::Decision::Genuine);
  e.add(va::GroundTruth::Fake, vc::Decision::Genuine);
  auto m = e.metrics();
  EXPECT_FALSE(m.precision.has_value());
  EXPECT_DOUBLE_EQ(*m.recall, 0.0);
  EXPECT_FALSE(m.f1.has_value());
}

TEST(DatasetEvaluation, ParseGroundTruth) {
  EXPECT_EQ(va::parse_ground_truth("FAKE"), va::GroundTruth::Fake);
  EXPECT_EQ(va::parse_ground_truth("real"), va::GroundTruth::Real);
  EXPECT_FALSE(va::parse_ground_truth("maybe").has_value());
}

TEST(DatasetManifest, SameFileNameInDifferentFoldersStaysDistinct) {
  auto entries = va::parse_dataset_manifest(
      "# label,features\n"
      "real,real/clip01.csv\n"
      "\n"
      "FAKE, fake/clip01.csv \r\n");
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[0].video_id, "real/clip01.csv");
  EXPECT_EQ((*entries)[0].truth, va::GroundTruth::Real);
  EXPECT_EQ((*entries)[1].video_id, "fake/clip01.csv");
  EXPECT_EQ((*entries)[1].truth, va::GroundTruth::Fake);
  EXPECT_EQ((*entries)[1].features_path, "fake/clip01.csv");

  // Scoring keyed by video id keeps each verdict with its own label.
  std::map<std::string, va::GroundTruth> truths;
  for (const auto& e : *entries) truths.emplace(e.video_id, e.truth);
  va::DatasetEvaluation eval;
  eval.add(truths.at("real/clip01.csv"), vc::Decision::Genuine);
  eval.add(truths.at("fake/clip01.csv"), vc::Decision::Deepfake);
  EXPECT_EQ(eval.matrix().true_negative, 1u);
  EXPECT_EQ(eval.matrix().true_positive, 1u);
  EXPECT_EQ(eval.matrix().false_negative, 0u);
  EXPECT_EQ(eval.matrix().false_positive, 0u);
}

TEST(DatasetManifest, PathListedTwiceIsRejected) {
  std::size_t bad_line = 0;
  auto entries = va::parse_dataset_manifest(
      "real,videos/a.csv\n"
      "fake,videos/b.csv\n"
      "fake,videos/./a.csv\n",
      &bad_line);
  ASSERT_FALSE(entries.has_value());
  EXPECT_EQ(entries.error(), vc::FusionError::InvalidInput);
  EXPECT_EQ(bad_line, 3u);
}

TEST(DatasetManifest, MalformedLinesAreRejected) {
  std::size_t bad_line = 0;
  EXPECT_FALSE(va::parse_dataset_manifest("real,a.csv\nmaybe,b.csv\n", &bad_line).has_value());
  EXPECT_EQ(bad_line, 2u);
  EXPECT_FALSE(va::parse_dataset_manifest("real a.csv\n", &bad_line).has_value());
  EXPECT_EQ(bad_line, 1u);
  EXPECT_FALSE(va::parse_dataset_manifest("fake,\n", &bad_line).has_value());
  EXPECT_EQ(bad_line, 1u);
}
