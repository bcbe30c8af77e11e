#include "app/Config.hpp"
#include "util/AsciiLower.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace sysglyph::app {

namespace {

constexpr uint64_t kMaxDimension = 65535;
constexpr uint64_t kMaxIntervalMs = 600000;

std::optional<uint64_t> parse_u64(std::string_view s) {
  uint64_t v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
  return v;
}

uint64_t require_u64(std::string_view what, std::string_view value) {
  auto v = parse_u64(value);
  if (!v) throw ConfigError(std::string(what) + " expects a non-negative integer, got '" + std::string(value) + "'");
  return *v;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

// Values gathered from the command line; unset means "not given".
struct CliArgs {
  std::optional<std::string> style;
  std::optional<uint64_t> width, height, interval_ms, seed, iterations;
  std::optional<std::string> config_path;
};

template <typename T>
std::optional<T> first_of(std::optional<T> a, std::optional<T> b) { return a ? a : b; }

std::optional<uint64_t> env_u64(const char* name) {
  const char* v = getenv_compat(name);
  if (!v) return std::nullopt;
  return require_u64(name, v);
}

std::optional<uint64_t> toml_u64(const sysglyph::util::TomlReader& toml, bool have_toml,
                                 const char* section, const char* key) {
  if (!have_toml || !toml.has(section, key)) return std::nullopt;
  auto v = toml.get_u64(section, key);
  if (!v) throw ConfigError(std::string("config [") + section + "] " + key + " expects a non-negative integer");
  return v;
}

uint16_t checked_dimension(const char* what, uint64_t v) {
  if (v == 0 || v > kMaxDimension) {
    throw ConfigError(std::string(what) + " must be in 1.." + std::to_string(kMaxDimension) + ", got " + std::to_string(v));
  }
  return static_cast<uint16_t>(v);
}

// Unknown names from files or the environment fall back to plasma; on the
// command line they are fatal.
sysglyph::model::Style resolve_style(const std::optional<std::string>& cli,
                                     const sysglyph::util::TomlReader& toml, bool have_toml) {
  if (cli) {
    auto s = sysglyph::model::parse_style(*cli);
    if (!s) throw ConfigError("unknown style '" + *cli + "' (expected plasma, waves or ember)");
    return *s;
  }
  std::string name;
  const char* origin = nullptr;
  if (have_toml && toml.has("canvas", "style")) { name = toml.get_string("canvas", "style"); origin = "config file"; }
  else if (const char* v = getenv_compat("SYSGLYPH_STYLE")) { name = v; origin = "SYSGLYPH_STYLE"; }
  if (!origin) return sysglyph::model::Style::Plasma;
  for (auto& c : name) c = sysglyph::util::ascii_lower(static_cast<unsigned char>(c));
  if (auto s = sysglyph::model::parse_style(name)) return *s;
  std::fprintf(stderr, "sysglyph: Config: unknown style '%s' from %s, using plasma\n", name.c_str(), origin);
  return sysglyph::model::Style::Plasma;
}

CliArgs parse_cli(const std::vector<std::string>& args, RunConfig& cfg) {
  CliArgs cli;
  bool have_command = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto value = [&](const char* flag) -> const std::string& {
      if (i + 1 >= args.size()) throw ConfigError(std::string(flag) + " requires a value");
      return args[++i];
    };
    if (a == "--interval") cli.interval_ms = require_u64("--interval", value("--interval"));
    else if (a == "--style") cli.style = value("--style");
    else if (a == "--width") cli.width = require_u64("--width", value("--width"));
    else if (a == "--height") cli.height = require_u64("--height", value("--height"));
    else if (a == "--seed") cli.seed = require_u64("--seed", value("--seed"));
    else if (a == "--config") cli.config_path = value("--config");
    else if (a == "--iterations") cli.iterations = require_u64("--iterations", value("--iterations"));
    else if (a == "--once") cfg.once = true;
    else if (a == "--json") cfg.json = true;
    else if (a == "-h" || a == "--help") cfg.show_help = true;
    else if (a == "-V" || a == "--version") cfg.show_version = true;
    else if (!have_command && a == "run") { cfg.command = RunConfig::Command::Run; have_command = true; }
    else if (!have_command && a == "metrics") { cfg.command = RunConfig::Command::Metrics; have_command = true; }
    else throw ConfigError("unrecognized argument '" + a + "'");
  }
  return cli;
}

} // namespace

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SYSGLYPH_", 0) == 0) {
    alt = std::string("sysglyph_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sysglyph/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sysglyph/config.toml";
  return {};
}

RunConfig load_run_config(const std::vector<std::string>& args) {
  RunConfig cfg{};
  CliArgs cli = parse_cli(args, cfg);
  if (cfg.show_help || cfg.show_version) return cfg;

  sysglyph::util::TomlReader toml;
  bool have_toml = false;
  if (cli.config_path) {
    if (!toml.load(*cli.config_path)) throw ConfigError("unable to open config file: " + *cli.config_path);
    have_toml = true;
  } else {
    auto path = config_file_path();
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) have_toml = toml.load(path);
  }

  // --- [canvas] ---
  auto width  = first_of(cli.width,  first_of(toml_u64(toml, have_toml, "canvas", "width"),  env_u64("SYSGLYPH_WIDTH")));
  auto height = first_of(cli.height, first_of(toml_u64(toml, have_toml, "canvas", "height"), env_u64("SYSGLYPH_HEIGHT")));
  cfg.canvas.width  = checked_dimension("width",  width.value_or(80));
  cfg.canvas.height = checked_dimension("height", height.value_or(24));
  cfg.canvas.style  = resolve_style(cli.style, toml, have_toml);
  cfg.seed = first_of(cli.seed, toml_u64(toml, have_toml, "canvas", "seed"));

  // --- [loop] ---
  auto interval = first_of(cli.interval_ms, first_of(toml_u64(toml, have_toml, "loop", "interval_ms"), env_u64("SYSGLYPH_INTERVAL_MS")));
  uint64_t interval_ms = interval.value_or(500);
  if (interval_ms > kMaxIntervalMs) {
    throw ConfigError("interval must be at most " + std::to_string(kMaxIntervalMs) + " ms");
  }
  cfg.interval = std::chrono::milliseconds(interval_ms);
  uint64_t iterations = cli.iterations.value_or(0);
  if (iterations > static_cast<uint64_t>(INT32_MAX)) throw ConfigError("--iterations is too large");
  cfg.iterations = static_cast<int>(iterations);

  // --- [ui] ---
  cfg.alt_screen = (have_toml && toml.has("ui", "alt_screen"))
    ? toml.get_bool("ui", "alt_screen", true) : env_flag("SYSGLYPH_ALT_SCREEN", true);
  cfg.verbose = (have_toml && toml.has("ui", "verbose"))
    ? toml.get_bool("ui", "verbose", false) : env_flag("SYSGLYPH_VERBOSE", false);
  return cfg;
}

std::string usage_text() {
  return
    "Usage: sysglyph [run|metrics] [options]\n"
    "Terminal generative art driven by system metrics\n"
    "\n"
    "Commands:\n"
    "  run                 Launch the generative art canvas (default)\n"
    "  metrics             Print current system metrics in JSON\n"
    "\n"
    "Options:\n"
    "  --interval MS       Frame interval in milliseconds (default 500)\n"
    "  --style NAME        Art style: plasma, waves, ember (default plasma)\n"
    "  --once              Render once and exit\n"
    "  --json              Output JSON snapshot instead of live art\n"
    "  --width N           Width of canvas (default 80)\n"
    "  --height N          Height of canvas (default 24)\n"
    "  --seed N            Seed override for deterministic art\n"
    "  --iterations N      Stop after N live frames (default: until q or Ctrl+C)\n"
    "  --config PATH       TOML config file\n"
    "  -h, --help          Show this help\n"
    "  -V, --version       Show version\n"
    "\n"
    "Keys: q quit (Ctrl+C also exits)\n";
}

} // namespace sysglyph::app
