#include "csv_splitter/input_file.hpp"
#include "csv_splitter/partition_engine.hpp"
#include "csv_splitter/path_utils.hpp"
#include "csv_splitter/progress.hpp"
#include "csv_splitter/run_report.hpp"
#include "csv_splitter/size_format.hpp"
#include "csv_splitter/split_error.hpp"
#include "csv_splitter/split_policy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

// Upper bound for --chunk-size; the read buffer is allocated up front.
constexpr std::uint64_t kMaxChunkBytes = 1024ull * 1024 * 1024;

struct Cli {
  std::string input;
  std::string mode;          // "parts" | "lines" | "size"
  std::string value;
  int modes_given = 0;
  std::string out_dir;
  std::string chunk_size;    // size string; empty -> engine default
  std::string report;
  bool exact_size = false;
  bool quiet = false;
  bool help = false;
  std::vector<std::string> errors;
};

void print_usage(std::ostream& os) {
  os <<
    "Usage: csv-splitter <input-file> (-p <parts> | -l <lines> | -s <size>)\n"
    "                    [--parts=N | --lines=N | --size=SIZE]\n"
    "                    [--out-dir=DIR] [--chunk-size=SIZE] [--exact-size]\n"
    "                    [--report=FILE] [--quiet]\n"
    "Split types:\n"
    "  -p <number>     Split into specified number of parts\n"
    "  -l <number>     Split by number of lines per part\n"
    "  -s <size>       Split by maximum size per part\n"
    "\nSize format examples:\n"
    "  1024   (bytes)\n"
    "  10K    (kilobytes)\n"
    "  100MB  (megabytes)\n"
    "  1GB    (gigabytes)\n"
    "  2TB    (terabytes)\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  auto set_mode = [&](const char* mode, std::string v) {
    c.mode = mode; c.value = std::move(v); ++c.modes_given;
  };
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (a == "-h" || a == "--help") { c.help = true; continue; }
    if (a == "-p" || a == "-l" || a == "-s") {
      if (i + 1 >= argc) { c.errors.push_back("missing value for " + a); continue; }
      set_mode(a == "-p" ? "parts" : (a == "-l" ? "lines" : "size"), argv[++i]);
      continue;
    }
    if (eat("--parts=", &v)) { set_mode("parts", v); continue; }
    if (eat("--lines=", &v)) { set_mode("lines", v); continue; }
    if (eat("--size=", &v))  { set_mode("size", v);  continue; }
    if (eat("--out-dir=", &c.out_dir)) continue;
    if (eat("--chunk-size=", &c.chunk_size)) continue;
    if (eat("--report=", &c.report)) continue;
    if (a == "--exact-size") { c.exact_size = true; continue; }
    if (a == "--quiet")      { c.quiet = true; continue; }
    if (!a.empty() && a[0] == '-' && a != "-") { c.errors.push_back("unknown option " + a); continue; }
    if (c.input.empty()) { c.input = a; continue; }
    c.errors.push_back("unexpected argument " + a);
  }
  if (!c.help) {
    if (c.input.empty()) c.errors.push_back("missing input file");
    if (c.modes_given == 0) c.errors.push_back("one of -p, -l or -s is required");
    if (c.modes_given > 1) c.errors.push_back("-p, -l and -s are mutually exclusive");
  }
  return c;
}

int exit_code_for(cs::ErrorKind k) {
  return k == cs::ErrorKind::InvalidArgument ? kExitUsage : kExitFailure;
}

int fail(const cs::SplitError& err) {
  std::cerr << "[split] Error (" << cs::to_string(err.kind) << "): " << err.message << "\n";
  return exit_code_for(err.kind);
}

// Validates every argument before any I/O happens.
bool build_policy(const Cli& cli, cs::SplitPolicy* out, cs::SplitError* err) {
  std::uint64_t v = 0;
  if (cli.mode == "size") {
    if (!cs::parse_size(cli.value, &v, err)) return false;
    *out = cs::SplitPolicy::by_max_size(v);
  } else {
    if (!cs::parse_count(cli.value, &v, err)) return false;
    *out = (cli.mode == "lines") ? cs::SplitPolicy::by_lines(v)
                                 : cs::SplitPolicy::by_part_count(v);
  }
  return out->validate(err);
}

}

int main(int argc, char** argv) {
  namespace ch = std::chrono;
  auto cli = parse_cli(argc, argv);
  if (cli.help) { print_usage(std::cout); return kExitOk; }
  if (!cli.errors.empty()) {
    for (const auto& e : cli.errors) std::cerr << "[split] " << e << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }

  cs::SplitError err;
  cs::SplitPolicy policy;
  if (!build_policy(cli, &policy, &err)) return fail(err);

  cs::PartitionEngine::Config ecfg;
  ecfg.size_cap = cli.exact_size ? cs::SizeCap::Exact : cs::SizeCap::Approximate;
  if (!cli.chunk_size.empty()) {
    std::uint64_t chunk = 0;
    if (!cs::parse_size(cli.chunk_size, &chunk, &err)) return fail(err);
    if (chunk == 0) {
      err.set(cs::ErrorKind::InvalidArgument, "Chunk size must be positive");
      return fail(err);
    }
    if (chunk > kMaxChunkBytes) {
      err.set(cs::ErrorKind::InvalidArgument,
              "Chunk size must not exceed " + cs::format_size(kMaxChunkBytes) + ": " + cli.chunk_size);
      return fail(err);
    }
    ecfg.read_chunk_bytes = static_cast<std::size_t>(chunk);
  }

  const auto t_load = ch::steady_clock::now();
  cs::InputFile input;
  if (!cs::load_input_file(cli.input, &input, &err)) return fail(err);
  const auto load_ms = ch::duration_cast<ch::milliseconds>(ch::steady_clock::now() - t_load).count();

  cs::PartNamerConfig ncfg;
  if (!cli.out_dir.empty()) {
    ncfg.out_dir = cli.out_dir;
    std::error_code ec;
    std::filesystem::create_directories(ncfg.out_dir, ec);
    if (ec) {
      err.set(cs::ErrorKind::IOError, cs::io_message("cannot create output directory", cli.out_dir, ec.value()));
      return fail(err);
    }
  }

  if (!cli.quiet) {
    std::cout << "[split] Input file size: " << cs::format_size(input.file_size) << "\n";
    if (policy.kind == cs::SplitPolicy::Kind::ByPartCount) {
      const auto resolved = policy.resolve(input.data_bytes());
      std::cout << "[split] Splitting into " << policy.limit << " parts, approximate size per part: "
                << cs::format_size(resolved.limit) << "\n";
    } else if (policy.kind == cs::SplitPolicy::Kind::ByLines) {
      std::cout << "[split] Splitting into parts of " << policy.limit << " lines each\n";
    } else {
      std::cout << "[split] Splitting into parts of maximum " << cs::format_size(policy.limit)
                << (cli.exact_size ? " (exact)" : "") << "\n";
    }
  }

  cs::PartitionEngine engine(input, cs::make_part_namer(input.path, ncfg), ecfg);
  cs::ProgressReporter progress(cli.quiet ? cs::ProgressReporter::Sink{} : cs::make_console_progress_sink());
  cs::SplitResult result;
  if (!engine.split(policy, &progress, &result)) return fail(engine.error());

  std::cout << "[split] Split completed: " << result.parts.size() << " parts created, total size: "
            << cs::format_size(result.bytes_processed) << "\n";

  if (!cli.report.empty()) {
    auto payload = cs::make_run_report(input, result, std::string(cs::to_string(policy.kind)),
                                       policy.limit, ecfg.size_cap);
    payload.stage_times.emplace_back("load_header", static_cast<std::uint64_t>(load_ms));
    payload.stage_times.emplace_back("split", static_cast<std::uint64_t>(result.wall_time_ms));
    std::string rerr;
    if (!cs::RunReportWriter::write_file(cli.report, payload, &rerr)) {
      std::cerr << "[split] write report failed: " << rerr << "\n";
      return kExitFailure;
    }
    if (!cli.quiet) std::cout << "[split] report: " << cli.report << "\n";
  }
  return kExitOk;
}
