#pragma once
#include <cstdint>
#include "model/Metrics.hpp"

namespace sysglyph::art {

// round(cpu% * 100) + used_memory + rx + tx + sum(disk total_space).
// The snapshot's own `entropy` field is ignored.
[[nodiscard]] uint64_t derive_entropy(const sysglyph::model::MetricsSnapshot& m);

} // namespace sysglyph::art
