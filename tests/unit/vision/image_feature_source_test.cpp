#include <veritas/core/mock_feature_source.hpp>
#include <veritas/vision/image_feature_source.hpp>
#include <veritas/vision/load_image.hpp>
#include <veritas/levels/color_evaluator.hpp>
#include <veritas/levels/texture_evaluator.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <vector>

namespace vc = veritas::core;
namespace vl = veritas::levels;
namespace vv = veritas::vision;

namespace {

vv::FaceFrame solid_bgr(std::uint8_t b, std::uint8_t g, std::uint8_t r, std::uint64_t index) {
  constexpr std::uint32_t kSide = 16;
  std::vector<std::byte> buf;
  for (std::uint32_t i = 0; i < kSide * kSide; ++i) {
    buf.push_back(std::byte{b});
    buf.push_back(std::byte{g});
    buf.push_back(std::byte{r});
  }
  return vv::FaceFrame(kSide, kSide, vv::PixelFormat::BGR8, std::move(buf), index,
                       static_cast<double>(index) / 30.0);
}

std::vector<vv::FaceSample> samples(std::size_t n, bool with_context) {
  std::vector<vv::FaceSample> out;
  for (std::size_t i = 0; i < n; ++i) {
    vv::FaceSample s{solid_bgr(40, 80, 160, i), std::nullopt};
    if (with_context) s.context = solid_bgr(40, 80, 160, i);
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<std::uint64_t> sorted_indices(const std::vector<vc::FrameFeatureRecord>& records) {
  std::vector<std::uint64_t> idx;
  for (const auto& r : records) idx.push_back(r.frame_index);
  std::sort(idx.begin(), idx.end());
  return idx;
}

}  // namespace

TEST(ImageFeatureSource, ExtractsTextureForEverySampleInParallel) {
  vv::ImageFeatureSource source(samples(24, false), 4, {16, 0.5});
  EXPECT_EQ(source.sample_count(), 24u);
  auto records = source.extract(vc::LevelId::Texture);
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 24u);
  const auto idx = sorted_indices(*records);
  for (std::size_t i = 0; i < idx.size(); ++i) EXPECT_EQ(idx[i], i);
  for (const auto& r : *records) {
    EXPECT_EQ(r.level, vc::LevelId::Texture);
    EXPECT_DOUBLE_EQ(*r.metric("lbp_energy"), 1.0);
  }
}

TEST(ImageFeatureSource, SequentialAndParallelAgreeAfterEvaluation) {
  vv::ImageFeatureSource serial(samples(12, true), 1, {16, 0.5});
  vv::ImageFeatureSource parallel(samples(12, true), 3, {16, 0.5});
  vl::ColorEvaluator eval;
  auto a = eval.evaluate(vc::LevelId::Color, *serial.extract(vc::LevelId::Color));
  auto b = eval.evaluate(vc::LevelId::Color, *parallel.extract(vc::LevelId::Color));
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->score, b->score);
  EXPECT_EQ(a->detail.metrics, b->detail.metrics);
  EXPECT_EQ(a->support, 12u);
}

TEST(ImageFeatureSource, SamplesWithoutContextAreDroppedByEvaluator) {
  auto s = samples(10, true);
  s[2].context.reset();
  s[5].context = vv::FaceFrame();
  vv::ImageFeatureSource source(std::move(s), 2);
  auto records = source.extract(vc::LevelId::Color);
  ASSERT_TRUE(records.has_value());
  EXPECT_EQ(records->size(), 10u);

  vl::ColorEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Color, *records);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->support, 8u);
  EXPECT_DOUBLE_EQ(r->detail.metrics.at("dropped_frames"), 2.0);
}

TEST(ImageFeatureSource, InvalidFaceYieldsDroppedTextureRecord) {
  auto s = samples(5, false);
  s[1].face = vv::FaceFrame();
  vv::ImageFeatureSource source(std::move(s), 0, {16, 0.5});
  auto records = source.extract(vc::LevelId::Texture);
  ASSERT_TRUE(records.has_value());
  vl::TextureEvaluator eval;
  auto r = eval.evaluate(vc::LevelId::Texture, *records);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->support, 4u);
}

TEST(ImageFeatureSource, PrecomputedLevelsPassThrough) {
  vv::ImageFeatureSource source(samples(3, false));
  source.set_records(vc::LevelId::Blink,
                     vc::make_uniform_records(vc::LevelId::Blink, 7, {{"EAR", 0.3}}));
  auto blink = source.extract(vc::LevelId::Blink);
  ASSERT_TRUE(blink.has_value());
  EXPECT_EQ(blink->size(), 7u);
  EXPECT_TRUE(source.failure_reason(vc::LevelId::Blink).empty());
}

TEST(ImageFeatureSource, LevelWithoutExtractorFails) {
  vv::ImageFeatureSource source(samples(3, false));
  auto lipsync = source.extract(vc::LevelId::LipSync);
  ASSERT_FALSE(lipsync.has_value());
  EXPECT_EQ(lipsync.error(), vc::FusionError::ExtractionError);
  EXPECT_NE(source.failure_reason(vc::LevelId::LipSync).find("lipsync"), std::string::npos);
}

TEST(LoadFaceFrame, ReadsWrittenImage) {
  const auto path = std::filesystem::temp_directory_path() / "veritas_load_face_frame_test.png";
  cv::Mat img(12, 20, CV_8UC3, cv::Scalar(10, 20, 30));
  ASSERT_TRUE(cv::imwrite(path.string(), img));

  auto frame = vv::load_face_frame(path.string(), 9, 0.3);
  std::filesystem::remove(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 20u);
  EXPECT_EQ(frame->height(), 12u);
  EXPECT_EQ(frame->format(), vv::PixelFormat::BGR8);
  EXPECT_EQ(frame->frame_index(), 9u);
  EXPECT_DOUBLE_EQ(frame->timestamp(), 0.3);
  EXPECT_EQ(frame->data()[0], std::byte{10});
}

TEST(LoadFaceFrame, RejectsNonFiniteTimestamp) {
  const auto path = std::filesystem::temp_directory_path() / "veritas_load_face_frame_ts.png";
  cv::Mat img(8, 8, CV_8UC3, cv::Scalar(40, 50, 60));
  ASSERT_TRUE(cv::imwrite(path.string(), img));

  // A zero frame rate turns index / fps into inf (or NaN for index 0).
  const auto at_inf = vv::load_face_frame(path.string(), 3, std::numeric_limits<double>::infinity());
  const auto at_nan = vv::load_face_frame(path.string(), 0, std::nan(""));
  const auto valid = vv::load_face_frame(path.string(), 3, 0.1);
  std::filesystem::remove(path);
  EXPECT_FALSE(at_inf.has_value());
  EXPECT_FALSE(at_nan.has_value());
  EXPECT_TRUE(valid.has_value());
}

TEST(LoadFaceFrame, MissingFileIsNullopt) {
  EXPECT_FALSE(vv::load_face_frame("/nonexistent/veritas/face.png").has_value());
}
