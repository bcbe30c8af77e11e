#pragma once
#include "model/Net.hpp"

namespace sysglyph::collectors {

class NetCollector {
public:
  bool sample(sysglyph::model::NetSnapshot& out);
private:
  // keep previous by interface name for deltas
  std::vector<sysglyph::model::NetIf> last_{};
};

} // namespace sysglyph::collectors
