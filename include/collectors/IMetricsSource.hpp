#pragma once
#include "model/Metrics.hpp"

namespace sysglyph::collectors {

// Where the render loop gets its per-frame gauges: the live procfs sampler,
// or a fixed source in tests.
class IMetricsSource {
public:
  virtual ~IMetricsSource() = default;

  // Always yields a complete snapshot with `entropy` derived. Gauges that
  // could not be read are left at zero.
  [[nodiscard]] virtual sysglyph::model::MetricsSnapshot sample() = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace sysglyph::collectors
