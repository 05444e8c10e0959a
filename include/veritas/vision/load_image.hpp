#pragma once

#include <veritas/vision/face_frame.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace veritas::vision {

/// Load a face-crop image file (BGR8 or Grayscale8) tagged with its position in
/// the video. Returns nullopt on failure or a non-finite timestamp.
std::optional<FaceFrame> load_face_frame(const std::string& path,
                                         std::uint64_t frame_index = 0,
                                         double timestamp = 0.0);

}  // namespace veritas::vision
