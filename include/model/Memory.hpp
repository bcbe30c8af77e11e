#pragma once
#include <cstdint>

namespace sysglyph::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
};

} // namespace sysglyph::model
