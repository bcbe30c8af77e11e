#include "art/Overlay.hpp"
#include "art/NoiseField.hpp"
#include <algorithm>
#include <cstdio>

namespace sysglyph::art {

std::string status_line(const sysglyph::model::MetricsSnapshot& m) {
  auto r = metric_ratios(m);
  double kbps = (static_cast<double>(m.network_rx) + static_cast<double>(m.network_tx)) / 1024.0;
  char buf[128];
  int n = std::snprintf(buf, sizeof(buf), "CPU %5.1f%% | MEM %5.1f%% | NET %7.1fk/s",
                        m.cpu_usage_percent, r.memory * 100.0, kbps);
  if (n < 0) return {};
  return std::string(buf, std::min<std::size_t>(static_cast<std::size_t>(n), sizeof(buf) - 1));
}

std::string signature_line(sysglyph::model::Style style, uint64_t entropy) {
  return "Style: " + std::string(sysglyph::model::style_name(style)) +
         " | Frames seeded by entropy " + std::to_string(entropy);
}

bool write_centered_status(sysglyph::model::Frame& frame, const std::string& text) {
  if (frame.empty()) return false;
  auto& row = frame[frame.size() / 2];
  if (text.size() > row.size()) return false;
  std::size_t start = (row.size() - text.size()) / 2;
  row.replace(start, text.size(), text);
  return true;
}

bool apply_signature(sysglyph::model::Frame& frame, sysglyph::model::Style style, uint64_t entropy) {
  if (frame.empty() || entropy % 7 != 0) return false;
  std::size_t width = frame.front().size();
  std::string sig = signature_line(style, entropy);
  sig.resize(width, ' ');
  frame.front() = std::move(sig);
  return true;
}

void composite_overlay(sysglyph::model::Frame& frame, const sysglyph::model::MetricsSnapshot& m,
                       sysglyph::model::Style style) {
  write_centered_status(frame, status_line(m));
  apply_signature(frame, style, m.entropy);
}

} // namespace sysglyph::art
