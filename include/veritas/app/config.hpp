#pragma once

#include <veritas/core/error.hpp>
#include <veritas/core/fusion_config.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace veritas::app {

/// Load config from a simple key=value file (one per line, '#' comments).
///
/// Recognized keys:
///   weight.<level>, anomaly_threshold.<level>   (level name or 1..6)
///   high_confidence_fake_threshold, minimum_support,
///   decision.suspicious_low, decision.deepfake_low,
///   max_consecutive_failures, sustained_run, aggregation_window
/// Missing keys keep their defaults. An unreadable file, an unknown key, an
/// unparsable value or a config failing validate_config() gives InvalidConfig.
[[nodiscard]] std::expected<veritas::core::FusionConfig, veritas::core::FusionError>
load_config(const std::string& path);

/// Same as load_config() but reads the key=value text directly.
[[nodiscard]] std::expected<veritas::core::FusionConfig, veritas::core::FusionError>
parse_config(std::string_view text);

/// Default config when no file is provided.
veritas::core::FusionConfig default_config();

}  // namespace veritas::app
