#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"
#include <charconv>
#include <string>
#include <string_view>

namespace sysglyph::collectors {

static void parse_cpu_line(std::string_view line, sysglyph::model::CpuTimes& out) {
  // label, then up to 8 jiffy counters
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end > start) {
      std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    }
    start = end + 1;
  }
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
}

bool CpuCollector::sample(sysglyph::model::CpuSnapshot& out) {
  auto txt_opt = sysglyph::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  sysglyph::model::CpuTimes agg{};
  bool found = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, agg); found = true; break; }
    start = end + 1;
  }
  if (!found) return false;
  double usage = 0.0;
  if (has_last_ && agg.total() >= last_total_.total() && agg.work() >= last_total_.work()) {
    auto td = agg.total() - last_total_.total();
    auto wd = agg.work()  - last_total_.work();
    usage = (td > 0) ? (100.0 * static_cast<double>(wd) / static_cast<double>(td)) : 0.0;
  }
  last_total_ = agg; has_last_ = true;
  out.usage_pct = usage > 100.0 ? 100.0 : usage;
  return true;
}

} // namespace sysglyph::collectors
