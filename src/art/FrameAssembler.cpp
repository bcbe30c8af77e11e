#include "art/FrameAssembler.hpp"
#include "art/GlyphMapper.hpp"
#include "art/Overlay.hpp"
#include "art/Palette.hpp"

namespace sysglyph::art {

sysglyph::model::Frame render_frame(const sysglyph::model::MetricsSnapshot& m,
                                    NoiseStream& noise,
                                    const sysglyph::model::Canvas& canvas) {
  const int w = canvas.width;
  const int h = canvas.height;
  const auto ratios = metric_ratios(m);
  const auto ramp = glyph_ramp(canvas.style);

  sysglyph::model::Frame frame;
  frame.reserve(static_cast<std::size_t>(h));
  for (int y = 0; y < h; ++y) {
    std::string row;
    row.reserve(static_cast<std::size_t>(w));
    for (int x = 0; x < w; ++x) {
      double swirl = swirl_at(x, y, w, h, noise.next(), ratios);
      row.push_back(glyph_for(intensity(swirl, ratios), ramp));
    }
    frame.push_back(std::move(row));
  }
  composite_overlay(frame, m, canvas.style);
  return frame;
}

} // namespace sysglyph::art
