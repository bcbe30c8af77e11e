#include "art/NoiseField.hpp"
#include <algorithm>
#include <cmath>

namespace sysglyph::art {

MetricRatios metric_ratios(const sysglyph::model::MetricsSnapshot& m) {
  MetricRatios r;
  r.cpu = m.cpu_usage_percent / 100.0;
  // Zero total memory would make the ratio undefined; treat as empty.
  r.memory = (m.total_memory > 0)
    ? static_cast<double>(m.used_memory) / static_cast<double>(m.total_memory)
    : 0.0;
  double traffic = static_cast<double>(m.network_rx) + static_cast<double>(m.network_tx);
  r.network = std::max(0.0, std::log1p(traffic) / 15.0);
  return r;
}

double swirl_at(int x, int y, int width, int height, double noise, const MetricRatios& r) {
  double nx = static_cast<double>(x) / static_cast<double>(width);
  double ny = static_cast<double>(y) / static_cast<double>(height);
  return std::sin(nx * r.cpu + ny * r.memory + noise * r.network);
}

} // namespace sysglyph::art
