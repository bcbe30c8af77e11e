#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sysglyph::model {

struct FsMount {
  std::string device;      // e.g., /dev/nvme0n1p2 or UUID=...
  uint64_t total_bytes{};
  uint64_t avail_bytes{};
};

struct FsSnapshot {
  std::vector<FsMount> mounts; // filtered, user-visible filesystems
};

} // namespace sysglyph::model
