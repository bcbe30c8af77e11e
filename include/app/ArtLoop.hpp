#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include "app/Config.hpp"
#include "art/NoiseField.hpp"
#include "collectors/IMetricsSource.hpp"

namespace sysglyph::app {

// Writing a frame to the terminal failed; fatal for the run.
struct DisplayError : public std::runtime_error { using std::runtime_error::runtime_error; };

struct SeedChoice {
  uint64_t seed{};
  bool from_override{false};
};

// Explicit override if present, else the entropy of the first sample.
[[nodiscard]] SeedChoice resolve_seed(const std::optional<uint64_t>& override_seed,
                                      const sysglyph::model::MetricsSnapshot& first);

// Drives sample -> render -> output. Owns the noise stream for the run; the
// stream is seeded once and never reset.
class ArtLoop {
public:
  ArtLoop(sysglyph::collectors::IMetricsSource& source, RunConfig cfg,
          std::chrono::milliseconds warmup = std::chrono::milliseconds(250));
  ArtLoop(const ArtLoop&) = delete;
  ArtLoop& operator=(const ArtLoop&) = delete;

  // Live animation on `fd` until ui::g_stop is set, `q` is pressed, or
  // max_frames frames were shown (0 = unbounded). Throws DisplayError.
  void run_live(int fd, int max_frames = 0);

  // Exactly one frame, written to `out` as a JSON snapshot. No live frames.
  // Returns false if `out` failed, or without output if a stop was
  // requested during the warm-up.
  [[nodiscard]] bool run_snapshot(std::ostream& out);

  // One MetricsSnapshot as JSON (the `metrics` command). Same failure rules
  // as run_snapshot.
  [[nodiscard]] bool print_metrics(std::ostream& out);

  [[nodiscard]] uint64_t seed() const { return seed_; }

private:
  void seed_from_first_sample();
  // Sleeps for the frame interval in short slices; false once a stop was requested.
  bool wait_interval();

  sysglyph::collectors::IMetricsSource& source_;
  RunConfig cfg_;
  std::chrono::milliseconds warmup_;
  std::optional<sysglyph::art::NoiseStream> noise_{};
  uint64_t seed_{0};
};

} // namespace sysglyph::app
