#include <veritas/app/config.hpp>
#include <veritas/core/level.hpp>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <system_error>

namespace veritas::app {

namespace vc = veritas::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_double(const std::string& value, double& out) {
  const char* first = value.data();
  const char* last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool parse_size(const std::string& value, std::size_t& out) {
  const char* first = value.data();
  const char* last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

/// "weight.lipsync" -> LevelId::LipSync when key starts with prefix.
std::optional<vc::LevelId> level_suffix(std::string_view key, std::string_view prefix) {
  if (!key.starts_with(prefix)) return std::nullopt;
  return vc::parse_level(key.substr(prefix.size()));
}

bool apply(vc::FusionConfig& c, const std::string& key, const std::string& value) {
  double d = 0.0;
  std::size_t n = 0;
  if (auto level = level_suffix(key, "weight.")) {
    if (!parse_double(value, d)) return false;
    c.weights[vc::level_index(*level)] = d;
  } else if (auto level = level_suffix(key, "anomaly_threshold.")) {
    if (!parse_double(value, d)) return false;
    c.anomaly_thresholds[vc::level_index(*level)] = d;
  } else if (key == "high_confidence_fake_threshold") {
    if (!parse_double(value, d)) return false;
    c.high_confidence_fake_threshold = d;
  } else if (key == "decision.suspicious_low") {
    if (!parse_double(value, d)) return false;
    c.decision_thresholds.suspicious_low = d;
  } else if (key == "decision.deepfake_low") {
    if (!parse_double(value, d)) return false;
    c.decision_thresholds.deepfake_low = d;
  } else if (key == "minimum_support") {
    if (!parse_size(value, n)) return false;
    c.minimum_support = n;
  } else if (key == "max_consecutive_failures") {
    if (!parse_size(value, n)) return false;
    c.max_consecutive_failures = n;
  } else if (key == "sustained_run") {
    if (!parse_size(value, n)) return false;
    c.sustained_run = n;
  } else if (key == "aggregation_window") {
    if (value == "none" || value.empty()) {
      c.aggregation_window.reset();
    } else {
      if (!parse_size(value, n)) return false;
      c.aggregation_window = n;
    }
  } else {
    return false;
  }
  return true;
}

}  // namespace

vc::FusionConfig default_config() {
  return vc::FusionConfig{};
}

std::expected<vc::FusionConfig, vc::FusionError> parse_config(std::string_view text) {
  vc::FusionConfig c = default_config();
  std::istringstream in{std::string(text)};

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(in, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value) || !apply(c, key, value)) {
      return std::unexpected(vc::FusionError::InvalidConfig);
    }
  }
  auto valid = vc::validate_config(c);
  if (!valid) return std::unexpected(valid.error());
  return c;
}

std::expected<vc::FusionConfig, vc::FusionError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::unexpected(vc::FusionError::InvalidConfig);
  std::ostringstream buf;
  buf << f.rdbuf();
  return parse_config(buf.str());
}

}  // namespace veritas::app
