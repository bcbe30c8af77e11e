#include "app/SnapshotJson.hpp"

namespace sysglyph::model {

void to_json(nlohmann::json& j, const DiskEntry& d) {
  j = nlohmann::json{
    {"name", d.name},
    {"total_space", d.total_space},
    {"available_space", d.available_space},
  };
}

void to_json(nlohmann::json& j, const MetricsSnapshot& m) {
  j = nlohmann::json{
    {"cpu_usage", m.cpu_usage_percent},
    {"load_avg", m.load_avg},
    {"total_memory", m.total_memory},
    {"used_memory", m.used_memory},
    {"disk_usage", m.disk_entries},
    {"network_rx", m.network_rx},
    {"network_tx", m.network_tx},
    {"entropy", m.entropy},
  };
}

} // namespace sysglyph::model

namespace sysglyph::app {

nlohmann::json snapshot_json(const Snapshot& s) {
  return nlohmann::json{
    {"metrics", s.metrics},
    {"frame", s.frame},
    {"width", s.canvas.width},
    {"height", s.canvas.height},
    {"style", std::string(sysglyph::model::style_name(s.canvas.style))},
  };
}

std::string dump_pretty(const nlohmann::json& j) {
  // replace invalid UTF-8 from mount names rather than throwing
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace sysglyph::app
