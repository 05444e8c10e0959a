#include <veritas/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace veritas::vision {

std::optional<FaceFrame> load_face_frame(const std::string& path,
                                         std::uint64_t frame_index,
                                         double timestamp) {
  if (!std::isfinite(timestamp)) return std::nullopt;
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) return std::nullopt;

  PixelFormat format = PixelFormat::BGR8;
  if (mat.channels() == 1) {
    format = PixelFormat::Grayscale8;
  } else if (mat.channels() == 4) {
    cv::Mat bgr;
    cv::cvtColor(mat, bgr, cv::COLOR_BGRA2BGR);
    mat = bgr;
  } else if (mat.channels() != 3) {
    return std::nullopt;
  }

  return detail::mat_to_frame(mat, format, frame_index, timestamp);
}

}  // namespace veritas::vision
