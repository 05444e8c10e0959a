#include <veritas/app/dataset_evaluation.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <utility>

namespace veritas::app {

namespace vc = veritas::core;

namespace {

std::optional<double> ratio(std::size_t num, std::size_t den) noexcept {
  if (den == 0) return std::nullopt;
  return static_cast<double>(num) / static_cast<double>(den);
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

}  // namespace

std::optional<GroundTruth> parse_ground_truth(std::string_view text) noexcept {
  auto equals = [text](std::string_view word) {
    return std::equal(text.begin(), text.end(), word.begin(), word.end(),
                      [](char a, char b) {
                        return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
  };
  if (equals("real")) return GroundTruth::Real;
  if (equals("fake")) return GroundTruth::Fake;
  return std::nullopt;
}

std::expected<std::vector<ManifestEntry>, vc::FusionError> parse_dataset_manifest(
    std::string_view text,
    std::size_t* bad_line) {
  std::vector<ManifestEntry> entries;
  std::set<std::string> seen;
  std::size_t line_no = 0;
  while (!text.empty()) {
    ++line_no;
    const auto nl = text.find('\n');
    const std::string_view line = trim(text.substr(0, nl));
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
    if (line.empty() || line.front() == '#') continue;

    auto fail = [&]() -> std::expected<std::vector<ManifestEntry>, vc::FusionError> {
      if (bad_line) *bad_line = line_no;
      return std::unexpected(vc::FusionError::InvalidInput);
    };
    const auto comma = line.find(',');
    if (comma == std::string_view::npos) return fail();
    const auto truth = parse_ground_truth(trim(line.substr(0, comma)));
    const std::string_view path = trim(line.substr(comma + 1));
    if (!truth || path.empty()) return fail();

    std::string id = std::filesystem::path(path).lexically_normal().generic_string();
    if (!seen.insert(id).second) return fail();
    entries.push_back({std::move(id), *truth, std::string(path)});
  }
  return entries;
}

void DatasetEvaluation::add(GroundTruth truth, vc::Decision decision) noexcept {
  const bool predicted_fake = decision != vc::Decision::Genuine;
  if (truth == GroundTruth::Fake) {
    ++(predicted_fake ? matrix_.true_positive : matrix_.false_negative);
  } else {
    ++(predicted_fake ? matrix_.false_positive : matrix_.true_negative);
  }
}

EvaluationMetrics DatasetEvaluation::metrics() const noexcept {
  EvaluationMetrics m;
  const auto& c = matrix_;
  m.accuracy = ratio(c.true_positive + c.true_negative, c.total());
  m.precision = ratio(c.true_positive, c.true_positive + c.false_positive);
  m.recall = ratio(c.true_positive, c.true_positive + c.false_negative);
  if (m.precision && m.recall && (*m.precision + *m.recall) > 0.0) {
    m.f1 = 2.0 * *m.precision * *m.recall / (*m.precision + *m.recall);
  }
  return m;
}

}  // namespace veritas::app
