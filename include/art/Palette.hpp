#pragma once
#include <cstddef>
#include <string_view>
#include <vector>
#include "model/Frame.hpp"

namespace sysglyph::art {

// ANSI 16-colour palette indices (0..7 normal, 8..15 bright).
enum class Color : int {
  Black = 0, DarkRed = 1, DarkGreen = 2, DarkYellow = 3,
  DarkBlue = 4, DarkMagenta = 5, DarkCyan = 6, Grey = 7,
  DarkGrey = 8, Red = 9, Green = 10, Yellow = 11,
  Blue = 12, Magenta = 13, Cyan = 14, White = 15,
};

// Ordered, non-empty row colours for a style.
[[nodiscard]] const std::vector<Color>& palette(sysglyph::model::Style s);

// palette[row mod size]
[[nodiscard]] Color row_color(sysglyph::model::Style s, std::size_t row);

// Glyphs from sparsest to densest; never empty.
[[nodiscard]] std::string_view glyph_ramp(sysglyph::model::Style s);

} // namespace sysglyph::art
