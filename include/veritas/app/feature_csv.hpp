#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/feature_source.hpp>
#include <veritas/core/frame_feature_record.hpp>
#include <veritas/core/level.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veritas::app {

/// Records grouped by level, indexed by level_index().
using FeatureTable =
    std::array<std::vector<veritas::core::FrameFeatureRecord>, veritas::core::kLevelCount>;

/// Parses feature records, one per line:
///
///   level,frame_index,timestamp,key=value;key=value
///
/// level is a name ("blink") or id ("2"). Blank lines, '#' comments and a
/// header line starting with "level," are skipped. A malformed line gives
/// InvalidInput; if \p bad_line is non-null it receives the 1-based line number.
[[nodiscard]] std::expected<FeatureTable, veritas::core::FusionError>
parse_feature_csv(std::string_view text, std::size_t* bad_line = nullptr);

/// Reads and parses a feature file; an unreadable file gives InvalidInput.
[[nodiscard]] std::expected<FeatureTable, veritas::core::FusionError>
read_feature_csv(const std::string& path, std::size_t* bad_line = nullptr);

/// Serves a FeatureTable level by level. A level with no rows extracts as an
/// empty record list (no evidence), not as an error.
class TableFeatureSource : public veritas::core::ILevelFeatureSource {
 public:
  explicit TableFeatureSource(FeatureTable table) : table_(std::move(table)) {}

  [[nodiscard]] std::expected<std::vector<veritas::core::FrameFeatureRecord>,
                              veritas::core::FusionError>
  extract(veritas::core::LevelId level) override {
    return table_[veritas::core::level_index(level)];
  }

 private:
  FeatureTable table_;
};

}  // namespace veritas::app
