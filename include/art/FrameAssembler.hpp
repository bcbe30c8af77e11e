#pragma once
#include "art/NoiseField.hpp"
#include "model/Frame.hpp"
#include "model/Metrics.hpp"

namespace sysglyph::art {

// Builds one frame: a noise draw per cell in row-major order, swirl, glyph,
// then the overlay. Canvas must already be validated (non-zero dimensions).
[[nodiscard]] sysglyph::model::Frame render_frame(const sysglyph::model::MetricsSnapshot& m,
                                                  NoiseStream& noise,
                                                  const sysglyph::model::Canvas& canvas);

} // namespace sysglyph::art
