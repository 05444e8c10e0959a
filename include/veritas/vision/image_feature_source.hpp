#pragma once

#include <veritas/core/feature_source.hpp>
#include <veritas/core/level.hpp>
#include <veritas/vision/color_features.hpp>
#include <veritas/vision/face_frame.hpp>
#include <veritas/vision/texture_features.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace veritas::vision {

/// One analyzed video frame: the aligned face crop and, optionally, the
/// surrounding region used for color / lighting comparison.
struct FaceSample {
  FaceFrame face;
  std::optional<FaceFrame> context;
};

/// Feature source backed by decoded face crops.
///
/// Texture (level 4) and color (level 5) records are computed here, across
/// samples on a worker pool; records arrive in completion order, which the
/// evaluators canonicalize. Records for the other levels come from upstream
/// detectors via set_records(). A sample the extractor rejects becomes a record
/// with NaN metrics, so the evaluator counts it as dropped instead of losing it.
class ImageFeatureSource : public veritas::core::ILevelFeatureSource {
 public:
  /// num_workers 0 = use hardware concurrency.
  explicit ImageFeatureSource(std::vector<FaceSample> samples,
                              std::size_t num_workers = 0,
                              TextureFeatureOptions texture_options = {});

  /// Precomputed records for a level this source does not extract itself.
  void set_records(veritas::core::LevelId level,
                   std::vector<veritas::core::FrameFeatureRecord> records);

  [[nodiscard]] std::expected<std::vector<veritas::core::FrameFeatureRecord>,
                              veritas::core::FusionError>
  extract(veritas::core::LevelId level) override;

  [[nodiscard]] std::string failure_reason(veritas::core::LevelId level) const override;

  [[nodiscard]] std::size_t sample_count() const noexcept { return samples_.size(); }

 private:
  std::vector<veritas::core::FrameFeatureRecord> extract_texture() const;
  std::vector<veritas::core::FrameFeatureRecord> extract_color() const;

  std::vector<FaceSample> samples_;
  std::size_t num_workers_;
  TextureFeatureExtractor texture_;
  ColorFeatureExtractor color_;
  std::array<std::optional<std::vector<veritas::core::FrameFeatureRecord>>,
             veritas::core::kLevelCount>
      precomputed_{};
  std::array<std::string, veritas::core::kLevelCount> failures_{};
};

}  // namespace veritas::vision
