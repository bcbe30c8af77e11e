#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/Frame.hpp"
#include "model/Metrics.hpp"

namespace sysglyph::model {

// found by ADL from nlohmann::json's converting constructor
void to_json(nlohmann::json& j, const DiskEntry& d);
void to_json(nlohmann::json& j, const MetricsSnapshot& m);

} // namespace sysglyph::model

namespace sysglyph::app {

// Export view of one rendered frame and what produced it.
struct Snapshot {
  sysglyph::model::MetricsSnapshot metrics;
  sysglyph::model::Frame frame;
  sysglyph::model::Canvas canvas;
};

// Keys: metrics, frame, width, height, style
[[nodiscard]] nlohmann::json snapshot_json(const Snapshot& s);

// Pretty-printed with a 2-space indent, no trailing newline
[[nodiscard]] std::string dump_pretty(const nlohmann::json& j);

} // namespace sysglyph::app
