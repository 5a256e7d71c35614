#include "csv_splitter/chunk_reader.hpp"
#include "test_support.hpp"

#include <cerrno>
#include <cstddef>
#include <limits>
#include <string>

using cs_test::expect;

int main(){
  const fs::path dir = cs_test::scratch_dir("reader");
  const fs::path f = dir / "utf8.csv";
  const std::string body = cs_test::make_csv("id,name,note", 500);
  cs_test::write_file(f, body);

  // Whole file in small chunks, starting past the header.
  const std::size_t header_len = body.find('\n') + 1;
  cs::ChunkReader::Config cfg;
  cfg.chunk_bytes = 97;
  cs::ChunkReader r(f.string(), cfg);
  expect(r.open(header_len), "open at header offset");
  std::string got;
  std::string_view chunk;
  std::size_t chunks = 0;
  while (r.next(chunk)) {
    expect(!chunk.empty() && chunk.size() <= cfg.chunk_bytes, "chunk size within bounds");
    got.append(chunk);
    ++chunks;
  }
  expect(!r.failed(), "no read error at eof");
  expect(got == body.substr(header_len), "data region reproduced");
  expect(r.bytes_read() == body.size() - header_len, "bytes_read");
  expect(r.position() == body.size(), "position at eof");
  expect(chunks == (got.size() + cfg.chunk_bytes - 1) / cfg.chunk_bytes, "chunk count");

  // Exhausted readers stay exhausted and cannot be reopened.
  expect(!r.next(chunk), "next after eof");
  expect(!r.open(0), "no restart after eof");

  // Offset at end of file -> empty stream, not an error.
  cs::ChunkReader tail(f.string(), cfg);
  expect(tail.open(body.size()), "open at eof");
  expect(!tail.next(chunk) && !tail.failed(), "empty stream at eof");

  cs::ChunkReader missing((dir / "nope.csv").string());
  expect(!missing.open(), "missing file fails");
  expect(missing.failed() && missing.last_error() == ENOENT, "ENOENT reported");

  // A buffer that cannot be allocated is reported, not thrown.
  cs::ChunkReader::Config huge;
  huge.chunk_bytes = std::numeric_limits<std::size_t>::max();
  cs::ChunkReader greedy(f.string(), huge);
  expect(!greedy.open(), "unallocatable chunk fails");
  expect(greedy.failed() && greedy.last_error() == ENOMEM, "ENOMEM reported");
  expect(!greedy.next(chunk), "no data after failed open");

  fs::remove_all(dir);
  return cs_test::report("chunk_reader");
}
