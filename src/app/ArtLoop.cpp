#include "app/ArtLoop.hpp"
#include "app/SnapshotJson.hpp"
#include "art/FrameAssembler.hpp"
#include "ui/Display.hpp"
#include "ui/Terminal.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

using namespace std::chrono;

namespace sysglyph::app {

SeedChoice resolve_seed(const std::optional<uint64_t>& override_seed,
                        const sysglyph::model::MetricsSnapshot& first) {
  if (override_seed) return SeedChoice{*override_seed, true};
  return SeedChoice{first.entropy, false};
}

ArtLoop::ArtLoop(sysglyph::collectors::IMetricsSource& source, RunConfig cfg,
                 std::chrono::milliseconds warmup)
    : source_(source), cfg_(std::move(cfg)), warmup_(warmup) {}

void ArtLoop::seed_from_first_sample() {
  if (noise_) return;
  auto first = source_.sample();
  auto choice = resolve_seed(cfg_.seed, first);
  seed_ = choice.seed;
  noise_.emplace(seed_);
  if (cfg_.verbose) {
    std::fprintf(stderr, "sysglyph: ArtLoop: seed %llu (%s), source %s\n",
                 static_cast<unsigned long long>(seed_),
                 choice.from_override ? "override" : "first sample entropy", source_.name());
  }
}

bool ArtLoop::wait_interval() {
  const auto deadline = steady_clock::now() + cfg_.interval;
  const bool input_tty = ::isatty(STDIN_FILENO) == 1;
  while (!sysglyph::ui::g_stop.load()) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    int to = static_cast<int>(std::clamp<long long>(remaining, 0, 100));
    if (input_tty) {
      // polled at least once per frame so `q` works with a zero interval
      struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
      int rv = ::poll(&pfd, 1, to);
      if (rv > 0 && (pfd.revents & POLLIN)) {
        unsigned char buf[8];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        for (ssize_t k = 0; k < n; ++k) {
          if (buf[k] == 'q' || buf[k] == 'Q') { sysglyph::ui::g_stop.store(true); break; }
        }
      }
    } else if (to > 0) {
      std::this_thread::sleep_for(milliseconds(to));
    }
    if (remaining <= 0) break;
  }
  return !sysglyph::ui::g_stop.load();
}

void ArtLoop::run_live(int fd, int max_frames) {
  seed_from_first_sample();
  for (int shown = 0; max_frames <= 0 || shown < max_frames; ++shown) {
    if (sysglyph::ui::g_stop.load()) break;
    auto metrics = source_.sample();
    auto frame = sysglyph::art::render_frame(metrics, *noise_, cfg_.canvas);
    if (!sysglyph::ui::display_frame(fd, frame, cfg_.canvas.style)) {
      throw DisplayError(std::string("terminal write failed: ") + std::strerror(errno));
    }
    if (max_frames > 0 && shown + 1 >= max_frames) break;
    if (!wait_interval()) break;
  }
}

bool ArtLoop::run_snapshot(std::ostream& out) {
  seed_from_first_sample();
  // delta gauges (cpu, network) need a second reading to mean anything
  if (warmup_.count() > 0) std::this_thread::sleep_for(warmup_);
  if (sysglyph::ui::g_stop.load()) return false;
  Snapshot snap;
  snap.metrics = source_.sample();
  snap.frame = sysglyph::art::render_frame(snap.metrics, *noise_, cfg_.canvas);
  snap.canvas = cfg_.canvas;
  out << dump_pretty(snapshot_json(snap)) << '\n';
  out.flush();
  return out.good();
}

bool ArtLoop::print_metrics(std::ostream& out) {
  (void)source_.sample(); // primes the delta collectors
  if (warmup_.count() > 0) std::this_thread::sleep_for(warmup_);
  if (sysglyph::ui::g_stop.load()) return false;
  nlohmann::json j = source_.sample();
  out << dump_pretty(j) << '\n';
  out.flush();
  return out.good();
}

} // namespace sysglyph::app
