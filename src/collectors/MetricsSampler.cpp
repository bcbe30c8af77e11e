#include "collectors/MetricsSampler.hpp"
#include "art/Entropy.hpp"
#include "util/Procfs.hpp"

#include <cstdio>
#include <sstream>

namespace sysglyph::collectors {

namespace {
enum WarnBit : unsigned { kWarnCpu = 1u, kWarnMem = 2u, kWarnNet = 4u, kWarnFs = 8u };
}

double read_loadavg_1m() {
  auto txt = sysglyph::util::read_file_string("/proc/loadavg");
  if (!txt) return 0.0;
  std::istringstream ss(*txt);
  double a1 = 0.0;
  if (!(ss >> a1) || a1 < 0.0) return 0.0;
  return a1;
}

void MetricsSampler::warn_once(unsigned bit, const char* what) {
  if (warned_ & bit) return;
  warned_ |= bit;
  std::fprintf(stderr, "sysglyph: MetricsSampler: %s unavailable, reporting zero\n", what);
}

sysglyph::model::MetricsSnapshot MetricsSampler::sample() {
  sysglyph::model::MetricsSnapshot m;

  sysglyph::model::CpuSnapshot cpu{};
  if (cpu_.sample(cpu)) m.cpu_usage_percent = cpu.usage_pct;
  else warn_once(kWarnCpu, "/proc/stat");

  sysglyph::model::Memory mem{};
  if (mem_.sample(mem)) {
    m.total_memory = mem.total_kb * 1024;
    m.used_memory = mem.used_kb * 1024;
  } else {
    warn_once(kWarnMem, "/proc/meminfo");
  }

  sysglyph::model::NetSnapshot net{};
  if (net_.sample(net)) {
    m.network_rx = static_cast<uint64_t>(net.agg_rx_bps);
    m.network_tx = static_cast<uint64_t>(net.agg_tx_bps);
  } else {
    warn_once(kWarnNet, "/proc/net/dev");
  }

  sysglyph::model::FsSnapshot fs{};
  if (fs_.sample(fs)) {
    m.disk_entries.reserve(fs.mounts.size());
    for (const auto& mount : fs.mounts) {
      m.disk_entries.push_back({mount.device, mount.total_bytes, mount.avail_bytes});
    }
  } else {
    warn_once(kWarnFs, "/proc/self/mounts");
  }

  m.load_avg = read_loadavg_1m();
  m.entropy = sysglyph::art::derive_entropy(m);
  return m;
}

} // namespace sysglyph::collectors
