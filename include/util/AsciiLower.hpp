#pragma once

namespace sysglyph::util {

// Locale-independent tolower for ASCII letters
constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

} // namespace sysglyph::util
