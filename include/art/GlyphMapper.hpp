#pragma once
#include <cstddef>
#include <string_view>
#include "art/NoiseField.hpp"

namespace sysglyph::art {

// fract(((swirl + 1) / 2) * memory + cpu), in [0,1)
[[nodiscard]] double intensity(double swirl, const MetricRatios& r);

// round(clamp(intensity, 0, 1) * (ramp_len - 1)), clamped to [0, ramp_len - 1].
// ramp_len must be >= 1.
[[nodiscard]] std::size_t glyph_index(double intensity, std::size_t ramp_len);

[[nodiscard]] char glyph_for(double intensity, std::string_view ramp);

} // namespace sysglyph::art
