#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace cs {

struct ProgressSnapshot {
  std::uint32_t part_index = 0;
  std::uint64_t part_lines = 0;        // lines in the current part
  std::uint64_t lines_processed = 0;
  std::uint64_t bytes_processed = 0;   // data region bytes
  std::uint64_t total_bytes = 0;       // input file size
  double percent = 0.0;
};

// Rate-limits progress emission to one record per interval, plus one
// unconditional final record.
class ProgressReporter {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;
  using Sink = std::function<void(const ProgressSnapshot&, bool final)>;

  struct Config {
    std::chrono::milliseconds interval{1000};
  };

  explicit ProgressReporter(Sink sink);
  ProgressReporter(Sink sink, Config cfg, ClockFn clock = nullptr);

  // Starts the throttle window; the first tick() waits a full interval.
  void start();

  // Emits `s` if at least one interval elapsed since the last emission.
  // Returns whether it emitted.
  bool tick(const ProgressSnapshot& s);

  // Always emits `s` as the final record.
  void finish(const ProgressSnapshot& s);

  std::uint64_t emitted() const noexcept { return emitted_; }

private:
  Sink sink_;
  Config cfg_;
  ClockFn clock_;
  std::optional<Clock::time_point> last_;
  std::uint64_t emitted_{0};
};

// Console sink: "\r[progress] part N, lines: L, processed: 1.5 MB (42.0%)".
ProgressReporter::Sink make_console_progress_sink();

}
