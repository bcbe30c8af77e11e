#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "model/Frame.hpp"

namespace sysglyph::app {

// Invalid user configuration; reported before any rendering starts.
struct ConfigError : public std::runtime_error { using std::runtime_error::runtime_error; };

struct RunConfig {
  enum class Command { Run, Metrics };
  Command command{Command::Run};
  sysglyph::model::Canvas canvas{};
  std::chrono::milliseconds interval{500};
  std::optional<uint64_t> seed{};
  int iterations{0}; // live frames before exiting; 0 = until stopped
  bool once{false};
  bool json{false};
  bool alt_screen{true};
  bool verbose{false};
  bool show_help{false};
  bool show_version{false};

  // One frame, emitted as a JSON snapshot, no live display
  [[nodiscard]] bool snapshot_mode() const { return once || json; }
};

// Resolve command line > TOML file > environment > compiled default, then
// validate. `args` excludes argv[0]. Throws ConfigError.
[[nodiscard]] RunConfig load_run_config(const std::vector<std::string>& args);

// $XDG_CONFIG_HOME/sysglyph/config.toml or ~/.config/sysglyph/config.toml
[[nodiscard]] std::string config_file_path();

// Environment variable helpers (SYSGLYPH_X or sysglyph_x)
const char* getenv_compat(const char* name);

[[nodiscard]] std::string usage_text();

} // namespace sysglyph::app
