#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace sysglyph::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

static bool is_virtual_if(const std::string& name) {
  return name.rfind("lo", 0) == 0 || name.rfind("veth", 0) == 0 || name.rfind("docker", 0) == 0 ||
         name.rfind("br-", 0) == 0 || name.rfind("virbr", 0) == 0;
}

bool NetCollector::sample(sysglyph::model::NetSnapshot& out) {
  auto txt_opt = sysglyph::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.interfaces.clear(); out.agg_rx_bps = out.agg_tx_bps = 0.0;
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0; double ts = now_secs();
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // format: iface: rx_bytes ... tx_bytes ...
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (is_virtual_if(name)) continue;
    std::istringstream ns(line.substr(colon + 1));
    uint64_t rx_bytes = 0, tx_bytes = 0; // 1st and 9th columns
    ns >> rx_bytes;
    for (int i = 0; i < 7; i++) { uint64_t tmp; ns >> tmp; }
    ns >> tx_bytes;
    if (!ns) continue;
    sysglyph::model::NetIf nif; nif.name = name; nif.rx_bytes = rx_bytes; nif.tx_bytes = tx_bytes; nif.last_ts = ts;
    for (const auto& p : last_) {
      if (p.name == name) {
        double dt = ts - p.last_ts; if (dt <= 0.0) dt = 1.0;
        // counter reset (interface re-created) yields no rate for this tick
        double dr  = rx_bytes >= p.rx_bytes ? static_cast<double>(rx_bytes - p.rx_bytes) : 0.0;
        double dtb = tx_bytes >= p.tx_bytes ? static_cast<double>(tx_bytes - p.tx_bytes) : 0.0;
        nif.rx_bps = dr / dt; nif.tx_bps = dtb / dt; break;
      }
    }
    out.agg_rx_bps += nif.rx_bps; out.agg_tx_bps += nif.tx_bps;
    out.interfaces.push_back(nif);
  }
  last_ = out.interfaces;
  return true;
}

} // namespace sysglyph::collectors
