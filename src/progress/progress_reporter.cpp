#include "csv_splitter/progress.hpp"
#include "csv_splitter/size_format.hpp"

#include <cstdio>
#include <iostream>

namespace cs {

ProgressReporter::ProgressReporter(Sink sink)
  : ProgressReporter(std::move(sink), Config{}, nullptr) {}

ProgressReporter::ProgressReporter(Sink sink, Config cfg, ClockFn clock)
  : sink_(std::move(sink)), cfg_(cfg), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return Clock::now(); };
}

void ProgressReporter::start() {
  last_ = clock_();
}

bool ProgressReporter::tick(const ProgressSnapshot& s) {
  const auto now = clock_();
  if (!last_) { last_ = now; return false; }
  if (now - *last_ < cfg_.interval) return false;
  last_ = now;
  ++emitted_;
  if (sink_) sink_(s, false);
  return true;
}

void ProgressReporter::finish(const ProgressSnapshot& s) {
  last_ = clock_();
  ++emitted_;
  if (sink_) sink_(s, true);
}

ProgressReporter::Sink make_console_progress_sink() {
  return [](const ProgressSnapshot& s, bool final) {
    char pct[32];
    std::snprintf(pct, sizeof(pct), "%.1f%%", s.percent);
    std::cout << "\r[progress] part " << s.part_index
              << ", lines: " << s.part_lines
              << ", processed: " << format_size(s.bytes_processed)
              << " (" << pct << ")";
    if (final) std::cout << "\n";
    std::cout.flush();
  };
}

}
