#pragma once
#include "model/Fs.hpp"

namespace sysglyph::collectors {

class FsCollector {
public:
  // Sample filesystem capacity across mounted filesystems (user-visible only)
  bool sample(sysglyph::model::FsSnapshot& out);
};

} // namespace sysglyph::collectors
