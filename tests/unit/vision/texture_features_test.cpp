#include <veritas/vision/texture_features.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace vc = veritas::core;
namespace vv = veritas::vision;

namespace {

template <typename PixelFn>
vv::FaceFrame gray_frame(std::uint32_t side, PixelFn pixel) {
  std::vector<std::byte> buf(static_cast<std::size_t>(side) * side);
  for (std::uint32_t y = 0; y < side; ++y) {
    for (std::uint32_t x = 0; x < side; ++x) {
      buf[static_cast<std::size_t>(y) * side + x] = static_cast<std::byte>(pixel(x, y));
    }
  }
  return vv::FaceFrame(side, side, vv::PixelFormat::Grayscale8, std::move(buf), 3, 0.1);
}

}  // namespace

TEST(TextureFeatureExtractor, FlatPatch) {
  vv::TextureFeatureExtractor ex({64, 0.5});
  auto r = ex.extract(gray_frame(64, [](auto, auto) { return 128; }));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->level, vc::LevelId::Texture);
  EXPECT_EQ(r->frame_index, 3u);
  EXPECT_DOUBLE_EQ(r->timestamp, 0.1);
  EXPECT_DOUBLE_EQ(*r->metric("lbp_energy"), 1.0);
  EXPECT_DOUBLE_EQ(*r->metric("hf_ratio"), 0.0);
}

TEST(TextureFeatureExtractor, CheckerboardIsAllHighFrequency) {
  vv::TextureFeatureExtractor ex({64, 0.5});
  auto r = ex.extract(gray_frame(64, [](auto x, auto y) { return ((x + y) % 2) ? 255 : 0; }));
  ASSERT_TRUE(r.has_value());
  EXPECT_GT(*r->metric("hf_ratio"), 0.99);
  // Two LBP codes, equally frequent.
  EXPECT_NEAR(*r->metric("lbp_energy"), 0.5, 1e-12);
}

TEST(TextureFeatureExtractor, SmoothGradientIsLowFrequency) {
  vv::TextureFeatureExtractor ex({64, 0.5});
  auto gradient = ex.extract(gray_frame(64, [](auto x, auto) { return static_cast<int>(x * 4); }));
  ASSERT_TRUE(gradient.has_value());
  EXPECT_LT(*gradient->metric("hf_ratio"), 0.2);
}

TEST(TextureFeatureExtractor, ResamplesToAnalysisSize) {
  vv::TextureFeatureExtractor ex({32, 0.5});
  auto r = ex.extract(gray_frame(100, [](auto, auto) { return 40; }));
  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(*r->metric("lbp_energy"), 1.0);
}

TEST(TextureFeatureExtractor, AcceptsColorFrames) {
  std::vector<std::byte> buf(16 * 16 * 3, std::byte{90});
  vv::FaceFrame bgr(16, 16, vv::PixelFormat::BGR8, std::move(buf));
  vv::TextureFeatureExtractor ex({16, 0.5});
  auto r = ex.extract(bgr);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->has_metric("hf_ratio"));
}

TEST(TextureFeatureExtractor, InvalidFrameIsInvalidInput) {
  vv::TextureFeatureExtractor ex;
  auto r = ex.extract(vv::FaceFrame());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), vc::FusionError::InvalidInput);
}

TEST(TextureFeatureExtractor, RejectsBadOptions) {
  EXPECT_THROW(vv::TextureFeatureExtractor({4, 0.5}), std::invalid_argument);
  EXPECT_THROW(vv::TextureFeatureExtractor({64, 0.0}), std::invalid_argument);
  EXPECT_THROW(vv::TextureFeatureExtractor({64, 1.0}), std::invalid_argument);
}
