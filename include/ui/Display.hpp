#pragma once

#include <string>
#include "model/Frame.hpp"

namespace sysglyph::ui {

// Clear, then per row: move cursor, row background colour, text, reset.
// With `color` false the SGR codes are left out.
[[nodiscard]] std::string compose_frame_output(const sysglyph::model::Frame& frame,
                                               sysglyph::model::Style style, bool color);

// Writes one frame to `fd` in a single checked write. False if the write failed.
[[nodiscard]] bool display_frame(int fd, const sysglyph::model::Frame& frame, sysglyph::model::Style style);

} // namespace sysglyph::ui
