#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace veritas::core {

/// Analysis level, ordered from cheapest/most generic to most specific.
enum class LevelId : std::uint8_t {
  Expression = 1,
  Blink = 2,
  HeadPose = 3,
  Texture = 4,
  Color = 5,
  LipSync = 6,
};

inline constexpr std::size_t kLevelCount = 6;

inline constexpr std::array<LevelId, kLevelCount> kAllLevels = {
    LevelId::Expression, LevelId::Blink, LevelId::HeadPose,
    LevelId::Texture,    LevelId::Color, LevelId::LipSync,
};

/// Zero-based slot of a level in per-level arrays (Expression -> 0).
[[nodiscard]] constexpr std::size_t level_index(LevelId level) noexcept {
  return static_cast<std::size_t>(level) - 1;
}

[[nodiscard]] constexpr LevelId level_at(std::size_t index) noexcept {
  return kAllLevels[index];
}

/// Stable lower-case name ("expression", "blink", "headpose", ...).
[[nodiscard]] std::string_view to_string(LevelId level) noexcept;

/// Accepts a level name or its numeric id ("1".."6").
[[nodiscard]] std::optional<LevelId> parse_level(std::string_view text) noexcept;

}  // namespace veritas::core
