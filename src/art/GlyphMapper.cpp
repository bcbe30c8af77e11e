#include "art/GlyphMapper.hpp"
#include <algorithm>
#include <cmath>

namespace sysglyph::art {

double intensity(double swirl, const MetricRatios& r) {
  double v = (swirl + 1.0) / 2.0 * r.memory + r.cpu;
  double f = v - std::floor(v);
  // floor() can round a tiny negative fraction up to exactly 1.0
  if (!(f >= 0.0) || f >= 1.0) return 0.0;
  return f;
}

std::size_t glyph_index(double intensity, std::size_t ramp_len) {
  if (ramp_len <= 1) return 0;
  double t = std::isnan(intensity) ? 0.0 : std::clamp(intensity, 0.0, 1.0);
  auto idx = static_cast<std::size_t>(std::llround(t * static_cast<double>(ramp_len - 1)));
  return std::min(idx, ramp_len - 1);
}

char glyph_for(double intensity, std::string_view ramp) {
  if (ramp.empty()) return ' ';
  return ramp[glyph_index(intensity, ramp.size())];
}

} // namespace sysglyph::art
