#include "minitest.hpp"
#include "art/Palette.hpp"
#include <vector>

using sysglyph::model::Style;

TEST(palette_cycles_per_row) {
  const auto& colors = sysglyph::art::palette(Style::Waves);
  ASSERT_EQ(colors.size(), 3u);
  const std::vector<size_t> expected{0, 1, 2, 0, 1, 2, 0};
  for (size_t row = 0; row < expected.size(); ++row) {
    ASSERT_TRUE(sysglyph::art::row_color(Style::Waves, row) == colors[expected[row]]);
  }
}

TEST(palette_short_frame_uses_prefix) {
  const auto& colors = sysglyph::art::palette(Style::Ember);
  ASSERT_TRUE(colors.size() > 2);
  ASSERT_TRUE(sysglyph::art::row_color(Style::Ember, 0) == colors[0]);
  ASSERT_TRUE(sysglyph::art::row_color(Style::Ember, 1) == colors[1]);
}

TEST(every_style_has_colors_and_ramp) {
  for (Style s : {Style::Plasma, Style::Waves, Style::Ember}) {
    ASSERT_TRUE(!sysglyph::art::palette(s).empty());
    ASSERT_TRUE(!sysglyph::art::glyph_ramp(s).empty());
  }
  ASSERT_EQ(sysglyph::art::glyph_ramp(Style::Plasma), " .:+*#%@");
}

TEST(style_names_parse_back) {
  for (Style s : {Style::Plasma, Style::Waves, Style::Ember}) {
    auto parsed = sysglyph::model::parse_style(sysglyph::model::style_name(s));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(*parsed == s);
  }
  ASSERT_TRUE(!sysglyph::model::parse_style("neon").has_value());
  ASSERT_TRUE(!sysglyph::model::parse_style("Plasma").has_value());
  ASSERT_TRUE(!sysglyph::model::parse_style("").has_value());
}
