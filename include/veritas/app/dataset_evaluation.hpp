#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/verdict.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veritas::app {

enum class GroundTruth : std::uint8_t {
  Real,
  Fake,
};

/// "real"/"fake" (case-insensitive).
[[nodiscard]] std::optional<GroundTruth> parse_ground_truth(std::string_view text) noexcept;

/// One labelled video of a dataset manifest.
struct ManifestEntry {
  std::string video_id;       // the listed path, normalized; unique per manifest
  GroundTruth truth{GroundTruth::Real};
  std::string features_path;  // as listed; relative paths are left to the caller
};

/// Parse manifest lines "<real|fake>,<features.csv>". Blank lines and '#'
/// comments are skipped. The video id is the whole listed path, so
/// "real/a.csv" and "fake/a.csv" stay two videos. InvalidInput on a malformed
/// line or a path listed twice; \p bad_line (if non-null) gets its 1-based number.
[[nodiscard]] std::expected<std::vector<ManifestEntry>, veritas::core::FusionError>
parse_dataset_manifest(std::string_view text, std::size_t* bad_line = nullptr);

/// Binary confusion matrix with FAKE as the positive class.
struct ConfusionMatrix {
  std::size_t true_positive{0};
  std::size_t false_positive{0};
  std::size_t true_negative{0};
  std::size_t false_negative{0};

  [[nodiscard]] std::size_t total() const noexcept {
    return true_positive + false_positive + true_negative + false_negative;
  }
};

/// Summary metrics; each is nullopt when its denominator is zero.
struct EvaluationMetrics {
  std::optional<double> accuracy;
  std::optional<double> precision;
  std::optional<double> recall;
  std::optional<double> f1;
};

/// Accumulates verdicts for a labelled dataset.
/// SUSPICIOUS and DEEPFAKE count as a FAKE prediction. Videos the pipeline
/// could not judge are tallied in errors() and kept out of the matrix.
class DatasetEvaluation {
 public:
  void add(GroundTruth truth, veritas::core::Decision decision) noexcept;
  void add_error() noexcept { ++errors_; }

  [[nodiscard]] const ConfusionMatrix& matrix() const noexcept { return matrix_; }
  [[nodiscard]] std::size_t errors() const noexcept { return errors_; }
  [[nodiscard]] EvaluationMetrics metrics() const noexcept;

 private:
  ConfusionMatrix matrix_{};
  std::size_t errors_{0};
};

}  // namespace veritas::app
