#include "csv_splitter/run_report.hpp"
#include "csv_splitter/input_file.hpp"
#include "csv_splitter/partition_engine.hpp"
#include "csv_splitter/path_utils.hpp"
#include "csv_splitter/split_policy.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace cs {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

RunReportPayload make_run_report(const InputFile& in, const SplitResult& result,
                                 const std::string& requested_policy,
                                 std::uint64_t requested_limit, SizeCap cap) {
  RunReportPayload p;
  p.filename = in.path;
  p.file_size = in.file_size;
  p.header_bytes = in.header_bytes;
  p.policy = requested_policy;
  p.limit = requested_limit;
  p.size_cap = std::string(to_string(cap));
  p.parts_created = result.parts.size();
  p.bytes_processed = result.bytes_processed;
  p.lines_processed = result.lines_processed;
  p.wall_time_ms = result.wall_time_ms;
  const double sec = result.wall_time_ms / 1000.0;
  p.throughput_mb_s = sec > 0.0 ? (result.bytes_processed / (1024.0 * 1024.0)) / sec : 0.0;
  p.parts.reserve(result.parts.size());
  for (const auto& part : result.parts) {
    p.parts.push_back(RunReportPart{part.index, part.path, part.bytes, part.lines});
  }
  return p;
}

std::string RunReportWriter::to_json(const RunReportPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"header_bytes\":" << p.header_bytes << ",";
  o << "\"policy\":";       esc(o, p.policy);       o << ",";
  o << "\"limit\":" << p.limit << ",";
  o << "\"size_cap\":";     esc(o, p.size_cap);     o << ",";
  o << "\"parts_created\":" << p.parts_created << ",";
  o << "\"bytes_processed\":" << p.bytes_processed << ",";
  o << "\"lines_processed\":" << p.lines_processed << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"parts\":[";
  for (size_t i=0;i<p.parts.size();++i){
    if (i) o << ",";
    const auto& part = p.parts[i];
    o << "{\"index\":" << part.index << ",\"path\":"; esc(o, part.path);
    o << ",\"bytes\":" << part.bytes
      << ",\"lines\":" << part.lines
      << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

bool RunReportWriter::write_file(const std::string& path, const RunReportPayload& p,
                                 std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create directory for " + path;
    return false;
  }
  const std::string json = to_json(p);
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  f.write(json.data(), static_cast<std::streamsize>(json.size()));
  f << "\n";
  f.close();
  if (!f) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
