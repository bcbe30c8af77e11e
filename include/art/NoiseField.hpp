#pragma once
#include <cstdint>
#include <random>
#include "model/Metrics.hpp"

namespace sysglyph::art {

// Ratios derived once per frame from a metrics sample.
struct MetricRatios {
  double cpu{};     // cpu_usage_percent / 100
  double memory{};  // used / total, 0 when total is 0
  double network{}; // ln(rx + tx + 1) / 15, never negative
};

[[nodiscard]] MetricRatios metric_ratios(const sysglyph::model::MetricsSnapshot& m);

// Shared pseudo-random stream. Seeded once per run and never reset; one draw
// per cell in row-major order.
class NoiseStream {
public:
  explicit NoiseStream(uint64_t seed) : gen_(seed) {}

  // Uniform in [0,1) from the top 53 bits of one 64-bit draw. Does not go
  // through std::uniform_real_distribution so the sequence is identical on
  // every standard library.
  double next() { return static_cast<double>(gen_() >> 11) * 0x1.0p-53; }

private:
  std::mt19937_64 gen_;
};

// sin(x/width * cpu + y/height * memory + noise * network)
[[nodiscard]] double swirl_at(int x, int y, int width, int height, double noise, const MetricRatios& r);

} // namespace sysglyph::art
