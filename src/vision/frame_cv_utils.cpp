#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace veritas::vision::detail {

std::optional<cv::Mat> frame_to_mat(const FaceFrame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> frame_to_gray(const FaceFrame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    default:
      gray = mat->clone();
      break;
  }
  return gray;
}

FaceFrame mat_to_frame(const cv::Mat& mat,
                       PixelFormat format,
                       std::uint64_t frame_index,
                       double timestamp) {
  if (mat.empty()) return FaceFrame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return FaceFrame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows),
                   format, std::move(buffer), frame_index, timestamp);
}

}  // namespace veritas::vision::detail
