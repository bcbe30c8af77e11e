#include "art/Entropy.hpp"
#include <cmath>

namespace sysglyph::art {

uint64_t derive_entropy(const sysglyph::model::MetricsSnapshot& m) {
  double cpu = m.cpu_usage_percent > 0.0 ? m.cpu_usage_percent : 0.0;
  uint64_t e = static_cast<uint64_t>(std::llround(cpu * 100.0));
  e += m.used_memory;
  e += m.network_rx;
  e += m.network_tx;
  for (const auto& d : m.disk_entries) e += d.total_space;
  return e;
}

} // namespace sysglyph::art
