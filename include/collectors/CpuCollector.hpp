#pragma once
#include "model/Cpu.hpp"

namespace sysglyph::collectors {

class CpuCollector {
public:
  CpuCollector() = default;
  // Usage is the delta against the previous call; the first call reports 0.
  bool sample(sysglyph::model::CpuSnapshot& out);
private:
  sysglyph::model::CpuTimes last_total_{};
  bool has_last_{false};
};

} // namespace sysglyph::collectors
