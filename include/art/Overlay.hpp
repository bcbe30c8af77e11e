#pragma once
#include <cstdint>
#include <string>
#include "model/Frame.hpp"
#include "model/Metrics.hpp"

namespace sysglyph::art {

// "CPU  42.0% | MEM  63.5% | NET    12.3k/s"
[[nodiscard]] std::string status_line(const sysglyph::model::MetricsSnapshot& m);

// "Style: <style> | Frames seeded by entropy <entropy>"
[[nodiscard]] std::string signature_line(sysglyph::model::Style style, uint64_t entropy);

// Writes `text` centred (left-biased) into row height/2. Skipped when the
// frame is empty or the text is wider than the row. Returns true if written.
bool write_centered_status(sysglyph::model::Frame& frame, const std::string& text);

// Replaces row 0 with the signature when entropy % 7 == 0 and the frame is
// non-empty. The row is padded or cut to keep the frame width.
bool apply_signature(sysglyph::model::Frame& frame, sysglyph::model::Style style, uint64_t entropy);

// Status line first, then the signature row, so row 0 wins on a 1-row frame.
void composite_overlay(sysglyph::model::Frame& frame, const sysglyph::model::MetricsSnapshot& m,
                       sysglyph::model::Style style);

} // namespace sysglyph::art
