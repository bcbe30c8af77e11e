#include "ui/Display.hpp"
#include "ui/Terminal.hpp"
#include "art/Palette.hpp"

#include <unistd.h>

namespace sysglyph::ui {

static std::string sgr_bg(int idx) {
  if (idx < 0) idx = 0;
  if (idx <= 7) return "\x1B[" + std::to_string(40 + idx) + "m";
  if (idx <= 15) return "\x1B[" + std::to_string(100 + (idx - 8)) + "m";
  // 256-color fallback
  return "\x1B[48;5;" + std::to_string(idx) + "m";
}

std::string compose_frame_output(const sysglyph::model::Frame& frame,
                                 sysglyph::model::Style style, bool color) {
  std::string out;
  size_t width = frame.empty() ? 0 : frame.front().size();
  out.reserve(frame.size() * (width + 24) + 16);
  out += "\x1B[H\x1B[2J";
  for (size_t row = 0; row < frame.size(); ++row) {
    out += "\x1B[" + std::to_string(row + 1) + ";1H";
    if (color) {
      out += sgr_bg(static_cast<int>(sysglyph::art::row_color(style, row)));
    }
    out += frame[row];
    if (color) out += "\x1B[0m";
  }
  return out;
}

bool display_frame(int fd, const sysglyph::model::Frame& frame, sysglyph::model::Style style) {
  bool color = (fd == STDOUT_FILENO) && tty_stdout();
  auto out = compose_frame_output(frame, style, color);
  return write_all(fd, out.data(), out.size());
}

} // namespace sysglyph::ui
