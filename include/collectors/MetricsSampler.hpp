#pragma once
#include "collectors/CpuCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/IMetricsSource.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"

namespace sysglyph::collectors {

// Folds the procfs collectors into one MetricsSnapshot per call.
class MetricsSampler final : public IMetricsSource {
public:
  MetricsSampler() = default;
  [[nodiscard]] sysglyph::model::MetricsSnapshot sample() override;
  [[nodiscard]] const char* name() const override { return "procfs"; }

private:
  void warn_once(unsigned bit, const char* what);

  CpuCollector cpu_{};
  MemoryCollector mem_{};
  NetCollector net_{};
  FsCollector fs_{};
  unsigned warned_{0};
};

// 1-minute load average from /proc/loadavg; 0 when unreadable.
[[nodiscard]] double read_loadavg_1m();

} // namespace sysglyph::collectors
