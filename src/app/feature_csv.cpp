#include <veritas/app/feature_csv.hpp>
#include <array>
#include <charconv>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>

namespace veritas::app {

namespace vc = veritas::core;

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

template <typename T>
bool parse_number(std::string_view text, T& out) {
  text = trim(text);
  if (text.empty()) return false;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, out);
  return ec == std::errc{} && ptr == last;
}

/// Splits at the first three commas; the remainder is the last field.
bool split_fields(std::string_view line, std::array<std::string_view, 4>& fields) {
  for (std::size_t i = 0; i < 3; ++i) {
    const auto pos = line.find(',');
    if (pos == std::string_view::npos) return false;
    fields[i] = line.substr(0, pos);
    line.remove_prefix(pos + 1);
  }
  fields[3] = line;
  return true;
}

bool parse_metrics(std::string_view text, std::map<std::string, double>& metrics) {
  while (!text.empty()) {
    const auto pos = text.find(';');
    const std::string_view item = trim(text.substr(0, pos));
    text = pos == std::string_view::npos ? std::string_view{} : text.substr(pos + 1);
    if (item.empty()) continue;
    const auto eq = item.find('=');
    if (eq == std::string_view::npos) return false;
    const std::string_view key = trim(item.substr(0, eq));
    double value = 0.0;
    if (key.empty() || !parse_number(item.substr(eq + 1), value)) return false;
    metrics[std::string(key)] = value;
  }
  return true;
}

}  // namespace

std::expected<FeatureTable, vc::FusionError> parse_feature_csv(std::string_view text,
                                                               std::size_t* bad_line) {
  FeatureTable table;
  std::istringstream in{std::string(text)};
  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string_view line = trim(raw);
    if (line.empty() || line.front() == '#' || line.starts_with("level,")) continue;

    std::array<std::string_view, 4> fields{};
    vc::FrameFeatureRecord record;
    std::optional<vc::LevelId> level;
    const bool ok = split_fields(line, fields) &&
                    (level = vc::parse_level(trim(fields[0]))).has_value() &&
                    parse_number(fields[1], record.frame_index) &&
                    parse_number(fields[2], record.timestamp) &&
                    parse_metrics(fields[3], record.raw_metrics);
    if (!ok) {
      if (bad_line) *bad_line = line_no;
      return std::unexpected(vc::FusionError::InvalidInput);
    }
    record.level = *level;
    table[vc::level_index(*level)].push_back(std::move(record));
  }
  return table;
}

std::expected<FeatureTable, vc::FusionError> read_feature_csv(const std::string& path,
                                                              std::size_t* bad_line) {
  std::ifstream f(path);
  if (!f) return std::unexpected(vc::FusionError::InvalidInput);
  std::ostringstream buf;
  buf << f.rdbuf();
  return parse_feature_csv(buf.str(), bad_line);
}

}  // namespace veritas::app
