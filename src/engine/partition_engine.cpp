#include "csv_splitter/partition_engine.hpp"
#include "csv_splitter/chunk_reader.hpp"
#include "csv_splitter/chunk_writer.hpp"
#include "csv_splitter/progress.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <utility>

namespace cs {

// Per-call streaming state: the open part, its writer and the counters.
struct PartitionEngine::StreamContext {
  explicit StreamContext(ChunkWriter::Config wcfg) : writer(wcfg) {}

  ChunkWriter writer;
  bool part_open = false;
  PartInfo part;
  std::vector<PartInfo> closed;
  std::uint64_t bytes_processed = 0;
  std::uint64_t lines_processed = 0;
  bool any_data = false;
  char last_byte = '\n';
};

namespace {

// Cut-point rule of one resolved policy. ByLines cuts after the n-th '\n';
// ByMaxSize cuts on the byte count, per chunk (approximate) or mid-chunk
// (exact).
struct CutRule {
  SplitPolicy::Kind kind;
  std::uint64_t limit;
  SizeCap cap;

  bool needs_new_part(bool part_open, const PartInfo& part) const {
    if (!part_open) return true;
    if (kind == SplitPolicy::Kind::ByLines) return part.lines >= limit;
    return part.bytes >= limit;
  }

  // How much of `rest` goes to the current part before the next check.
  std::size_t take(const PartInfo& part, std::string_view rest) const {
    if (kind == SplitPolicy::Kind::ByLines) {
      const void* nl = std::memchr(rest.data(), '\n', rest.size());
      return nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - rest.data()) + 1
                : rest.size();
    }
    if (cap == SizeCap::Approximate) return rest.size();
    const std::uint64_t room = limit - part.bytes;
    return static_cast<std::size_t>(std::min<std::uint64_t>(room, rest.size()));
  }
};

ProgressSnapshot make_snapshot(const InputFile& in, std::uint32_t part_index,
                               std::uint64_t part_lines, std::uint64_t lines,
                               std::uint64_t bytes) {
  ProgressSnapshot s;
  s.part_index = part_index;
  s.part_lines = part_lines;
  s.lines_processed = lines;
  s.bytes_processed = bytes;
  s.total_bytes = in.file_size;
  s.percent = in.file_size ? (in.header_bytes + bytes) * 100.0 / in.file_size : 100.0;
  return s;
}

}

PartitionEngine::PartitionEngine(InputFile input, PartNamer namer)
  : PartitionEngine(std::move(input), std::move(namer), Config{}) {}

PartitionEngine::PartitionEngine(InputFile input, PartNamer namer, Config cfg)
  : input_(std::move(input)), namer_(std::move(namer)), cfg_(cfg) {}

bool PartitionEngine::roll_over(StreamContext& ctx) {
  if (ctx.part_open && !close_part(ctx)) return false;

  PartInfo next;
  next.index = static_cast<std::uint32_t>(ctx.closed.size() + 1);
  next.path = namer_(next.index).string();
  if (!ctx.writer.open(next.path)) {
    err_.set(ErrorKind::IOError, io_message("cannot create part", next.path, ctx.writer.last_error()));
    return false;
  }
  ctx.part = std::move(next);
  ctx.part_open = true;
  if (!ctx.writer.append(input_.header_raw)) {
    err_.set(ErrorKind::IOError, io_message("write failed on", ctx.part.path, ctx.writer.last_error()));
    return false;
  }
  ctx.part.bytes = input_.header_bytes;
  return true;
}

bool PartitionEngine::close_part(StreamContext& ctx) {
  ctx.part_open = false;
  if (!ctx.writer.close()) {
    err_.set(ErrorKind::IOError, io_message("close failed on", ctx.part.path, ctx.writer.last_error()));
    return false;
  }
  ctx.closed.push_back(ctx.part);
  return true;
}

bool PartitionEngine::write_data(StreamContext& ctx, std::string_view bytes) {
  if (!ctx.writer.append(bytes)) {
    err_.set(ErrorKind::IOError, io_message("write failed on", ctx.part.path, ctx.writer.last_error()));
    return false;
  }
  const auto nl = static_cast<std::uint64_t>(std::count(bytes.begin(), bytes.end(), '\n'));
  ctx.part.bytes += bytes.size();
  ctx.part.lines += nl;
  ctx.bytes_processed += bytes.size();
  ctx.lines_processed += nl;
  ctx.any_data = true;
  ctx.last_byte = bytes.back();
  return true;
}

bool PartitionEngine::split(const SplitPolicy& policy, ProgressReporter* progress, SplitResult* out) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  err_.clear();

  if (!policy.validate(&err_)) return false;
  if (!namer_) {
    err_.set(ErrorKind::InvalidArgument, "No part naming strategy configured");
    return false;
  }
  const SplitPolicy effective = policy.resolve(input_.data_bytes());
  if (effective.kind == SplitPolicy::Kind::ByMaxSize && cfg_.size_cap == SizeCap::Exact &&
      effective.limit <= input_.header_bytes) {
    err_.set(ErrorKind::InvalidArgument,
             "Exact size cap of " + std::to_string(effective.limit) +
             " bytes must exceed the header length (" + std::to_string(input_.header_bytes) + " bytes)");
    return false;
  }

  ChunkReader::Config rcfg;
  rcfg.chunk_bytes = cfg_.read_chunk_bytes;
  ChunkReader reader(input_.path, rcfg);
  if (!reader.open(input_.header_bytes)) {
    err_.set(ErrorKind::IOError, io_message("cannot open", input_.path, reader.last_error()));
    return false;
  }

  ChunkWriter::Config wcfg;
  wcfg.buffer_bytes = cfg_.write_buffer_bytes;
  StreamContext ctx(wcfg);
  const CutRule rule{effective.kind, effective.limit, cfg_.size_cap};
  if (progress) progress->start();

  std::string_view chunk;
  while (reader.next(chunk)) {
    while (!chunk.empty()) {
      if (rule.needs_new_part(ctx.part_open, ctx.part) && !roll_over(ctx)) return false;
      const std::size_t n = rule.take(ctx.part, chunk);
      if (!write_data(ctx, chunk.substr(0, n))) return false;
      chunk.remove_prefix(n);
    }
    if (progress) {
      progress->tick(make_snapshot(input_, ctx.part.index, ctx.part.lines,
                                   ctx.lines_processed, ctx.bytes_processed));
    }
  }
  if (reader.failed()) {
    err_.set(ErrorKind::IOError, io_message("read failed on", input_.path, reader.last_error()));
    return false;
  }

  // Header-only input still yields one part.
  if (!ctx.part_open && !roll_over(ctx)) return false;
  // An unterminated last line counts as a line.
  if (ctx.any_data && ctx.last_byte != '\n') {
    ++ctx.part.lines;
    ++ctx.lines_processed;
  }
  const ProgressSnapshot last = make_snapshot(input_, ctx.part.index, ctx.part.lines,
                                              ctx.lines_processed, ctx.bytes_processed);
  if (!close_part(ctx)) return false;

  if (out) {
    out->policy = effective;
    out->parts = std::move(ctx.closed);
    out->bytes_processed = ctx.bytes_processed;
    out->lines_processed = ctx.lines_processed;
    out->wall_time_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  }
  if (progress) progress->finish(last);
  return true;
}

}
