#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysglyph::model {

// Row-major grid of glyphs, row 0 on top. Every row holds exactly `width` chars.
using Frame = std::vector<std::string>;

enum class Style { Plasma, Waves, Ember };

[[nodiscard]] std::string_view style_name(Style s);
[[nodiscard]] std::optional<Style> parse_style(std::string_view name);

// Per-run canvas parameters, validated at the configuration boundary.
struct Canvas {
  uint16_t width{80};
  uint16_t height{24};
  Style style{Style::Plasma};
};

} // namespace sysglyph::model
