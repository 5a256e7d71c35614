#pragma once
#include "csv_splitter/input_file.hpp"
#include "csv_splitter/path_utils.hpp"
#include "csv_splitter/split_error.hpp"
#include "csv_splitter/split_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

class ProgressReporter;

struct PartInfo {
  std::uint32_t index = 0;
  std::string path;
  std::uint64_t bytes = 0;   // header included
  std::uint64_t lines = 0;   // header excluded
};

struct SplitResult {
  SplitPolicy policy;                 // effective policy (ByPartCount resolved)
  std::vector<PartInfo> parts;
  std::uint64_t bytes_processed = 0;  // data region bytes copied
  std::uint64_t lines_processed = 0;
  double wall_time_ms = 0.0;
};

// Streams the data region of one input into header-prefixed parts.
// Each split() call owns its reader, writer and counters; nothing is shared
// between calls.
class PartitionEngine {
public:
  struct Config {
    std::size_t read_chunk_bytes   = 8 * 1024 * 1024;
    std::size_t write_buffer_bytes = 8 * 1024 * 1024;
    SizeCap size_cap = SizeCap::Approximate;
  };

  PartitionEngine(InputFile input, PartNamer namer);
  PartitionEngine(InputFile input, PartNamer namer, Config cfg);

  // Runs one split. `progress` may be null. On failure returns false,
  // error() says why, and parts already closed stay on disk.
  bool split(const SplitPolicy& policy, ProgressReporter* progress, SplitResult* out);

  const InputFile& input() const noexcept { return input_; }
  const Config& config() const noexcept { return cfg_; }
  const SplitError& error() const noexcept { return err_; }

private:
  struct StreamContext;

  bool roll_over(StreamContext& ctx);
  bool close_part(StreamContext& ctx);
  bool write_data(StreamContext& ctx, std::string_view bytes);

  InputFile input_;
  PartNamer namer_;
  Config cfg_;
  SplitError err_;
};

}
