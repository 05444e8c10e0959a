#include <veritas/app/feature_csv.hpp>
#include <gtest/gtest.h>
#include <cmath>

namespace va = veritas::app;
namespace vc = veritas::core;

TEST(FeatureCsv, ParsesRecordsByLevel) {
  auto table = va::parse_feature_csv(
      "level,frame_index,timestamp,metrics\n"
      "# comment\n"
      "blink,0,0.0,EAR=0.31\n"
      "2,1,0.033,EAR=0.29\n"
      "\n"
      "lipsync,0,0.0,MAR=0.4;audio_energy=0.7\n");
  ASSERT_TRUE(table.has_value());
  const auto& blink = (*table)[vc::level_index(vc::LevelId::Blink)];
  ASSERT_EQ(blink.size(), 2u);
  EXPECT_EQ(blink[1].frame_index, 1u);
  EXPECT_DOUBLE_EQ(blink[1].timestamp, 0.033);
  EXPECT_DOUBLE_EQ(*blink[1].metric("EAR"), 0.29);
  EXPECT_EQ(blink[1].level, vc::LevelId::Blink);

  const auto& lipsync = (*table)[vc::level_index(vc::LevelId::LipSync)];
  ASSERT_EQ(lipsync.size(), 1u);
  EXPECT_DOUBLE_EQ(*lipsync[0].metric("audio_energy"), 0.7);
  EXPECT_TRUE((*table)[vc::level_index(vc::LevelId::Texture)].empty());
}

TEST(FeatureCsv, EmptyMetricsAllowed) {
  auto table = va::parse_feature_csv("color,4,0.5,\n");
  ASSERT_TRUE(table.has_value());
  const auto& color = (*table)[vc::level_index(vc::LevelId::Color)];
  ASSERT_EQ(color.size(), 1u);
  EXPECT_TRUE(color[0].raw_metrics.empty());
}

TEST(FeatureCsv, NanValueKeptAsMissingMetric) {
  auto table = va::parse_feature_csv("texture,0,0.0,hf_ratio=nan\n");
  ASSERT_TRUE(table.has_value());
  const auto& r = (*table)[vc::level_index(vc::LevelId::Texture)][0];
  EXPECT_EQ(r.raw_metrics.count("hf_ratio"), 1u);
  EXPECT_FALSE(r.has_metric("hf_ratio"));
}

TEST(FeatureCsv, MalformedLineReportsLineNumber) {
  std::size_t bad = 0;
  auto table = va::parse_feature_csv(
      "blink,0,0.0,EAR=0.3\n"
      "blink,x,0.1,EAR=0.3\n",
      &bad);
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error(), vc::FusionError::InvalidInput);
  EXPECT_EQ(bad, 2u);

  EXPECT_FALSE(va::parse_feature_csv("nose,0,0.0,a=1\n").has_value());
  EXPECT_FALSE(va::parse_feature_csv("blink,0,0.0,EAR\n").has_value());
  EXPECT_FALSE(va::parse_feature_csv("blink,0\n").has_value());
}

TEST(FeatureCsv, TableSourceServesEmptyLevelsWithoutError) {
  auto table = va::parse_feature_csv("blink,0,0.0,EAR=0.3\n");
  ASSERT_TRUE(table.has_value());
  va::TableFeatureSource source(std::move(*table));
  auto blink = source.extract(vc::LevelId::Blink);
  ASSERT_TRUE(blink.has_value());
  EXPECT_EQ(blink->size(), 1u);
  auto color = source.extract(vc::LevelId::Color);
  ASSERT_TRUE(color.has_value());
  EXPECT_TRUE(color->empty());
}

TEST(FeatureCsv, MissingFileIsInvalidInput) {
  auto table = va::read_feature_csv("/nonexistent/features.csv");
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error(), vc::FusionError::InvalidInput);
}
