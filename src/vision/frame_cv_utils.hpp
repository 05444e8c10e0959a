#pragma once

#include <veritas/vision/face_frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace veritas::vision::detail {

/// Wrap a FaceFrame as a cv::Mat view (no copy). Returns nullopt if the frame
/// is invalid. The view must not outlive the frame.
std::optional<cv::Mat> frame_to_mat(const FaceFrame& frame);

/// Single-channel 8-bit copy of the frame, or nullopt if the frame is invalid.
std::optional<cv::Mat> frame_to_gray(const FaceFrame& frame);

/// Convert cv::Mat (CV_8UC1 or CV_8UC3) to FaceFrame (copy).
FaceFrame mat_to_frame(const cv::Mat& mat,
                       PixelFormat format,
                       std::uint64_t frame_index,
                       double timestamp);

}  // namespace veritas::vision::detail
