#pragma once
#include "model/Memory.hpp"

namespace sysglyph::collectors {

class MemoryCollector {
public:
  bool sample(sysglyph::model::Memory& out) const; // returns true on success
};

} // namespace sysglyph::collectors
