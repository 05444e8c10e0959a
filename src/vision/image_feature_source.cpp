#include <veritas/vision/image_feature_source.hpp>
#include "parallel_extract.hpp"
#include <limits>
#include <utility>

namespace veritas::vision {

namespace vc = veritas::core;

namespace {

vc::FrameFeatureRecord rejected_record(const FaceFrame& face,
                                       vc::LevelId level,
                                       const char* key) {
  vc::FrameFeatureRecord r;
  r.frame_index = face.frame_index();
  r.timestamp = face.timestamp();
  r.level = level;
  r.raw_metrics[key] = std::numeric_limits<double>::quiet_NaN();
  return r;
}

}  // namespace

ImageFeatureSource::ImageFeatureSource(std::vector<FaceSample> samples,
                                       std::size_t num_workers,
                                       TextureFeatureOptions texture_options)
    : samples_(std::move(samples)),
      num_workers_(num_workers),
      texture_(texture_options) {}

void ImageFeatureSource::set_records(vc::LevelId level,
                                     std::vector<vc::FrameFeatureRecord> records) {
  precomputed_[vc::level_index(level)] = std::move(records);
}

std::expected<std::vector<vc::FrameFeatureRecord>, vc::FusionError>
ImageFeatureSource::extract(vc::LevelId level) {
  const std::size_t idx = vc::level_index(level);
  failures_[idx].clear();
  if (precomputed_[idx].has_value()) {
    return *precomputed_[idx];
  }
  switch (level) {
    case vc::LevelId::Texture:
      return extract_texture();
    case vc::LevelId::Color:
      return extract_color();
    default:
      failures_[idx] = "no extractor or records for level " + std::string(vc::to_string(level));
      return std::unexpected(vc::FusionError::ExtractionError);
  }
}

std::string ImageFeatureSource::failure_reason(vc::LevelId level) const {
  return failures_[vc::level_index(level)];
}

std::vector<vc::FrameFeatureRecord> ImageFeatureSource::extract_texture() const {
  return detail::extract_parallel(samples_.size(), num_workers_, [this](std::size_t i) {
    const FaceFrame& face = samples_[i].face;
    auto record = texture_.extract(face);
    if (!record) return rejected_record(face, vc::LevelId::Texture, "hf_ratio");
    return std::move(*record);
  });
}

std::vector<vc::FrameFeatureRecord> ImageFeatureSource::extract_color() const {
  return detail::extract_parallel(samples_.size(), num_workers_, [this](std::size_t i) {
    const FaceSample& sample = samples_[i];
    if (!sample.context) {
      return rejected_record(sample.face, vc::LevelId::Color, "hue_delta");
    }
    auto record = color_.extract(sample.face, *sample.context);
    if (!record) return rejected_record(sample.face, vc::LevelId::Color, "hue_delta");
    return std::move(*record);
  });
}

}  // namespace veritas::vision
