#include "art/Palette.hpp"

namespace sysglyph::art {

using sysglyph::model::Style;

namespace {

struct StylePreset {
  std::vector<Color> colors;
  std::string_view ramp;
};

const StylePreset& preset(Style s) {
  static const StylePreset plasma{{Color::Magenta, Color::DarkMagenta, Color::Blue, Color::Black}, " .:+*#%@"};
  static const StylePreset waves{{Color::Blue, Color::Cyan, Color::Black}, " .-~*~="};
  static const StylePreset ember{{Color::DarkRed, Color::Red, Color::DarkYellow, Color::Yellow}, " `^\",:;Il!i"};
  switch (s) {
    case Style::Waves: return waves;
    case Style::Ember: return ember;
    case Style::Plasma: break;
  }
  return plasma;
}

} // namespace

const std::vector<Color>& palette(Style s) { return preset(s).colors; }

Color row_color(Style s, std::size_t row) {
  const auto& colors = palette(s);
  return colors[row % colors.size()];
}

std::string_view glyph_ramp(Style s) { return preset(s).ramp; }

} // namespace sysglyph::art
