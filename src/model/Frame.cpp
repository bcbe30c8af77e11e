#include "model/Frame.hpp"

namespace sysglyph::model {

std::string_view style_name(Style s) {
  switch (s) {
    case Style::Waves: return "waves";
    case Style::Ember: return "ember";
    case Style::Plasma: break;
  }
  return "plasma";
}

std::optional<Style> parse_style(std::string_view name) {
  if (name == "plasma") return Style::Plasma;
  if (name == "waves") return Style::Waves;
  if (name == "ember") return Style::Ember;
  return std::nullopt;
}

} // namespace sysglyph::model
