#include <veritas/vision/color_features.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <optional>

namespace veritas::vision {

namespace vc = veritas::core;

namespace {

struct ColorStats {
  double hue_degrees{0.0};
  double luma{0.0};
};

std::optional<ColorStats> color_stats(const FaceFrame& frame) {
  if (frame.format() != PixelFormat::BGR8 && frame.format() != PixelFormat::RGB8) {
    return std::nullopt;
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) return std::nullopt;

  const bool rgb = frame.format() == PixelFormat::RGB8;
  cv::Mat hsv;
  cv::cvtColor(*mat, hsv, rgb ? cv::COLOR_RGB2HSV : cv::COLOR_BGR2HSV);
  cv::Mat gray;
  cv::cvtColor(*mat, gray, rgb ? cv::COLOR_RGB2GRAY : cv::COLOR_BGR2GRAY);

  // Hue is circular; average unit vectors weighted by saturation so grey
  // pixels (undefined hue) do not pull the mean.
  double sx = 0.0;
  double sy = 0.0;
  for (int y = 0; y < hsv.rows; ++y) {
    const auto* row = hsv.ptr<cv::Vec3b>(y);
    for (int x = 0; x < hsv.cols; ++x) {
      const double angle = row[x][0] * 2.0 * std::numbers::pi / 180.0;  // OpenCV hue is 0..179
      const double weight = row[x][1] / 255.0;
      sx += weight * std::cos(angle);
      sy += weight * std::sin(angle);
    }
  }

  ColorStats s;
  s.hue_degrees = (sx == 0.0 && sy == 0.0) ? 0.0 : std::atan2(sy, sx) * 180.0 / std::numbers::pi;
  s.luma = cv::mean(gray)[0];
  return s;
}

double wrap_degrees(double d) {
  while (d > 180.0) d -= 360.0;
  while (d <= -180.0) d += 360.0;
  return d;
}

}  // namespace

std::expected<vc::FrameFeatureRecord, vc::FusionError> ColorFeatureExtractor::extract(
    const FaceFrame& face,
    const FaceFrame& context) const {
  const auto f = color_stats(face);
  const auto c = color_stats(context);
  if (!f || !c) {
    return std::unexpected(vc::FusionError::InvalidInput);
  }

  vc::FrameFeatureRecord record;
  record.frame_index = face.frame_index();
  record.timestamp = face.timestamp();
  record.level = vc::LevelId::Color;
  record.raw_metrics["hue_delta"] = wrap_degrees(f->hue_degrees - c->hue_degrees);
  record.raw_metrics["luma_delta"] = f->luma - c->luma;
  return record;
}

}  // namespace veritas::vision
