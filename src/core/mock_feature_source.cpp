#include <veritas/core/mock_feature_source.hpp>
#include <utility>

namespace veritas::core {

void MockFeatureSource::set_records(LevelId level,
                                    std::vector<FrameFeatureRecord> records) {
  records_[level_index(level)] = std::move(records);
  failures_[level_index(level)].reset();
}

void MockFeatureSource::set_failure(LevelId level, std::string reason) {
  failures_[level_index(level)] = std::move(reason);
}

std::expected<std::vector<FrameFeatureRecord>, FusionError>
MockFeatureSource::extract(LevelId level) {
  const std::size_t idx = level_index(level);
  ++calls_[idx];
  if (failures_[idx].has_value()) {
    return std::unexpected(FusionError::ExtractionError);
  }
  return records_[idx];
}

std::string MockFeatureSource::failure_reason(LevelId level) const {
  return failures_[level_index(level)].value_or(std::string{});
}

std::vector<FrameFeatureRecord> make_uniform_records(
    LevelId level,
    std::size_t count,
    const std::map<std::string, double>& metrics,
    double fps) {
  std::vector<FrameFeatureRecord> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    FrameFeatureRecord r;
    r.frame_index = i;
    r.timestamp = static_cast<double>(i) / fps;
    r.level = level;
    r.raw_metrics = metrics;
    out.push_back(std::move(r));
  }
  return out;
}

}  // namespace veritas::core
