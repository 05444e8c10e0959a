#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/frame_feature_record.hpp>
#include <veritas/vision/face_frame.hpp>
#include <expected>

namespace veritas::vision {

/// Color / lighting consistency between a face crop and its surroundings
/// (neck, background), emitted as a level-5 record:
///   "hue_delta"  - circular mean hue of face minus context, degrees (-180, 180]
///   "luma_delta" - mean luminance of face minus context, 8-bit levels
/// Blended or relit faces drift from the scene's color and light.
class ColorFeatureExtractor {
 public:
  /// InvalidInput unless both frames are valid 3-channel images.
  [[nodiscard]] std::expected<veritas::core::FrameFeatureRecord, veritas::core::FusionError>
  extract(const FaceFrame& face, const FaceFrame& context) const;
};

}  // namespace veritas::vision
