#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cs {

struct InputFile;
struct SplitResult;
enum class SizeCap;

struct RunReportPart {
  std::uint32_t index = 0;
  std::string path;
  std::uint64_t bytes = 0;
  std::uint64_t lines = 0;
};

struct RunReportPayload {
  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
  std::uint64_t header_bytes = 0;

  // Policy
  std::string policy;          // "lines" | "max_size" | "parts"
  std::uint64_t limit = 0;
  std::string size_cap;        // "approximate" | "exact"

  // Top-level KPIs
  std::uint64_t parts_created = 0;
  std::uint64_t bytes_processed = 0;
  std::uint64_t lines_processed = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::vector<RunReportPart> parts;
};

// `requested` is the policy as given on the command line; result.policy is
// the resolved one.
RunReportPayload make_run_report(const InputFile& in, const SplitResult& result,
                                 const std::string& requested_policy,
                                 std::uint64_t requested_limit, SizeCap cap);

class RunReportWriter {
public:
  static std::string to_json(const RunReportPayload& p);

  // Writes to_json(p) to `path`, creating parent directories.
  static bool write_file(const std::string& path, const RunReportPayload& p,
                         std::string* err_out = nullptr);
};

}
