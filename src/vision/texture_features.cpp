#include <veritas/vision/texture_features.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace veritas::vision {

namespace vc = veritas::core;

namespace {

std::uint8_t lbp_code(const cv::Mat& gray, int y, int x) {
  const std::uint8_t c = gray.at<std::uint8_t>(y, x);
  std::uint8_t code = 0;
  code |= (gray.at<std::uint8_t>(y - 1, x - 1) >= c) << 7;
  code |= (gray.at<std::uint8_t>(y - 1, x) >= c) << 6;
  code |= (gray.at<std::uint8_t>(y - 1, x + 1) >= c) << 5;
  code |= (gray.at<std::uint8_t>(y, x + 1) >= c) << 4;
  code |= (gray.at<std::uint8_t>(y + 1, x + 1) >= c) << 3;
  code |= (gray.at<std::uint8_t>(y + 1, x) >= c) << 2;
  code |= (gray.at<std::uint8_t>(y + 1, x - 1) >= c) << 1;
  code |= (gray.at<std::uint8_t>(y, x - 1) >= c) << 0;
  return code;
}

double lbp_histogram_energy(const cv::Mat& gray) {
  std::array<std::size_t, 256> hist{};
  std::size_t total = 0;
  for (int y = 1; y < gray.rows - 1; ++y) {
    for (int x = 1; x < gray.cols - 1; ++x) {
      ++hist[lbp_code(gray, y, x)];
      ++total;
    }
  }
  if (total == 0) return 1.0;
  double energy = 0.0;
  for (const std::size_t count : hist) {
    const double p = static_cast<double>(count) / static_cast<double>(total);
    energy += p * p;
  }
  return energy;
}

double high_frequency_ratio(const cv::Mat& gray, double cutoff) {
  cv::Mat float_img;
  gray.convertTo(float_img, CV_32F);

  cv::Mat dft_result;
  cv::dft(float_img, dft_result, cv::DFT_COMPLEX_OUTPUT);

  std::vector<cv::Mat> planes;
  cv::split(dft_result, planes);
  cv::Mat magnitude;
  cv::magnitude(planes[0], planes[1], magnitude);

  const int rows = magnitude.rows;
  const int cols = magnitude.cols;
  const double dc = magnitude.at<float>(0, 0);
  double total = 0.0;
  double high = 0.0;
  for (int v = 0; v < rows; ++v) {
    // Unshifted spectrum: index k and N-k are the same frequency.
    const double fv = static_cast<double>(std::min(v, rows - v)) / (rows / 2.0);
    for (int u = 0; u < cols; ++u) {
      if (u == 0 && v == 0) continue;  // DC
      const double fu = static_cast<double>(std::min(u, cols - u)) / (cols / 2.0);
      const double m = magnitude.at<float>(v, u);
      const double power = m * m;
      total += power;
      if (std::sqrt(fu * fu + fv * fv) > cutoff) high += power;
    }
  }
  // Flat patch: what is left besides DC is float rounding.
  constexpr double kFlatPower = 1e-10;
  if (total <= kFlatPower * (dc * dc + 1.0)) return 0.0;
  return high / total;
}

}  // namespace

TextureFeatureExtractor::TextureFeatureExtractor(TextureFeatureOptions options)
    : options_(options) {
  if (options_.analysis_size < 8) {
    throw std::invalid_argument("TextureFeatureExtractor: analysis_size must be >= 8");
  }
  if (!(options_.hf_cutoff > 0.0 && options_.hf_cutoff < 1.0)) {
    throw std::invalid_argument("TextureFeatureExtractor: hf_cutoff must be in (0, 1)");
  }
}

std::expected<vc::FrameFeatureRecord, vc::FusionError> TextureFeatureExtractor::extract(
    const FaceFrame& face) const {
  auto gray = detail::frame_to_gray(face);
  if (!gray) {
    return std::unexpected(vc::FusionError::InvalidInput);
  }

  cv::Mat patch = *gray;
  const int side = options_.analysis_size;
  if (patch.rows != side || patch.cols != side) {
    cv::resize(*gray, patch, cv::Size(side, side), 0, 0, cv::INTER_AREA);
  }

  vc::FrameFeatureRecord record;
  record.frame_index = face.frame_index();
  record.timestamp = face.timestamp();
  record.level = vc::LevelId::Texture;
  record.raw_metrics["lbp_energy"] = lbp_histogram_energy(patch);
  record.raw_metrics["hf_ratio"] = high_frequency_ratio(patch, options_.hf_cutoff);
  return record;
}

}  // namespace veritas::vision
