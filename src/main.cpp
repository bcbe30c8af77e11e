#include "app/ArtLoop.hpp"
#include "app/Config.hpp"
#include "collectors/MetricsSampler.hpp"
#include "ui/Terminal.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

#ifndef SYSGLYPH_VERSION
#define SYSGLYPH_VERSION "0.0.0"
#endif

using sysglyph::app::ArtLoop;
using sysglyph::app::RunConfig;

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  RunConfig cfg;
  try {
    cfg = sysglyph::app::load_run_config(args);
  } catch (const sysglyph::app::ConfigError& e) {
    std::fprintf(stderr, "sysglyph: error: %s\n", e.what());
    std::fprintf(stderr, "Try 'sysglyph --help' for more information.\n");
    return 2;
  }
  if (cfg.show_help) {
    std::cout << sysglyph::app::usage_text();
    return 0;
  }
  if (cfg.show_version) {
    std::cout << "sysglyph " << SYSGLYPH_VERSION << "\n";
    return 0;
  }

  sysglyph::collectors::MetricsSampler sampler;
  ArtLoop loop(sampler, cfg);

  // JSON modes keep the default signal disposition: an interrupt ends the
  // process before anything reaches stdout.
  if (cfg.command == RunConfig::Command::Metrics) {
    return loop.print_metrics(std::cout) ? 0 : 2;
  }
  if (cfg.snapshot_mode()) {
    return loop.run_snapshot(std::cout) ? 0 : 2;
  }

  std::signal(SIGINT, sysglyph::ui::on_sigint);
  std::signal(SIGTERM, sysglyph::ui::on_sigint);
  try {
    // Guards restore the terminal on every exit from this scope, throws included
    sysglyph::ui::TerminalSession session{cfg.alt_screen && sysglyph::ui::tty_stdout()};
    std::atexit(&sysglyph::ui::on_atexit_restore);
    loop.run_live(STDOUT_FILENO, cfg.iterations);
  } catch (const sysglyph::app::DisplayError& e) {
    std::fprintf(stderr, "sysglyph: error: %s\n", e.what());
    return 2;
  }
  return 0;
}
