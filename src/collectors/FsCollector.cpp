#include "collectors/FsCollector.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>
#include <sstream>
#include <unordered_set>

namespace sysglyph::collectors {

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs"
  };
  return bad.count(fstype) != 0;
}

bool FsCollector::sample(sysglyph::model::FsSnapshot& out) {
  out.mounts.clear();
  auto txt_opt = sysglyph::util::read_file_string("/proc/self/mounts");
  if (!txt_opt) return false;
  std::istringstream f(*txt_opt);
  std::unordered_set<std::string> seen_mounts;
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype, opts;
    if (!(ls >> device >> mountpoint >> fstype >> opts)) continue;
    if (is_pseudo_fs(fstype)) continue;
    if (!seen_mounts.insert(mountpoint).second) continue;

    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) continue;
    sysglyph::model::FsMount m;
    m.device = device;
    m.total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    m.avail_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    out.mounts.push_back(std::move(m));
  }
  return true;
}

} // namespace sysglyph::collectors
