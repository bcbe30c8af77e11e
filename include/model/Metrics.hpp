#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sysglyph::model {

struct DiskEntry {
  std::string name;          // mount device, e.g. /dev/nvme0n1p2
  uint64_t total_space{};     // bytes
  uint64_t available_space{}; // bytes
};

// One sample of host gauges. Filled by the sampler, read-only afterwards.
struct MetricsSnapshot {
  double   cpu_usage_percent{}; // 0..100
  double   load_avg{};          // 1-minute load average
  uint64_t total_memory{};      // bytes
  uint64_t used_memory{};       // bytes
  uint64_t network_rx{};        // bytes/s since previous sample
  uint64_t network_tx{};        // bytes/s since previous sample
  std::vector<DiskEntry> disk_entries;
  uint64_t entropy{};           // derived, see art::derive_entropy
};

} // namespace sysglyph::model
