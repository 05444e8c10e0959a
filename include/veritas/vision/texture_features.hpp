#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/frame_feature_record.hpp>
#include <veritas/vision/face_frame.hpp>
#include <expected>

namespace veritas::vision {

struct TextureFeatureOptions {
  /// Face crops are resampled to a square of this side before analysis.
  int analysis_size{128};
  /// Normalized spatial frequency (0 = DC, 1 = Nyquist on each axis) above
  /// which spectral energy counts as high frequency.
  double hf_cutoff{0.5};
};

/// Texture / frequency statistics of a face crop, emitted as a level-4 record:
///   "lbp_energy" - energy (sum of squared bin shares) of the 8-neighbour LBP
///                  histogram; 1 for a perfectly flat patch.
///   "hf_ratio"   - share of non-DC spectral power above hf_cutoff.
class TextureFeatureExtractor {
 public:
  /// Throws std::invalid_argument for analysis_size < 8 or hf_cutoff outside (0, 1).
  explicit TextureFeatureExtractor(TextureFeatureOptions options = {});

  /// InvalidInput if the frame is empty or malformed.
  [[nodiscard]] std::expected<veritas::core::FrameFeatureRecord, veritas::core::FusionError>
  extract(const FaceFrame& face) const;

  [[nodiscard]] const TextureFeatureOptions& options() const noexcept { return options_; }

 private:
  TextureFeatureOptions options_;
};

}  // namespace veritas::vision
