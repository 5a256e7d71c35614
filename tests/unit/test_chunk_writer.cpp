#include "csv_splitter/chunk_writer.hpp"
#include "test_support.hpp"

#include <string>

using cs_test::expect;

int main() {
  const fs::path dir = cs_test::scratch_dir("writer");

  cs::ChunkWriter::Config cfg;
  cfg.buffer_bytes = 16;
  cs::ChunkWriter w(cfg);

  // Appends larger than the buffer are flushed through.
  const fs::path a = dir / "a.csv";
  expect(w.open(a.string()), "open a");
  expect(!w.open(a.string()), "second open while open fails");
  std::string expected;
  for (int i = 0; i < 50; ++i) {
    std::string piece = "row-" + std::to_string(i) + (i % 3 ? "\n" : ",xxxxxxxxxxxxxxxxxxxxxxxx\n");
    expect(w.append(piece), "append");
    expected += piece;
  }
  expect(w.bytes_written() == expected.size(), "bytes_written counts buffered bytes");
  expect(w.close(), "close a");
  expect(!w.is_open(), "closed");
  expect(cs_test::read_file(a) == expected, "a content");
  expect(!w.close(), "double close fails");
  expect(!w.append("x"), "append after close fails");

  // Same writer reused for the next file; existing content is truncated.
  const fs::path b = dir / "b.csv";
  cs_test::write_file(b, std::string(1000, 'z'));
  expect(w.open(b.string()), "open b");
  expect(w.append("h\n") && w.append("1\n"), "append b");
  expect(w.bytes_written() == 4, "counter reset per file");
  expect(w.close(), "close b");
  expect(cs_test::read_file(b) == "h\n1\n", "b truncated and rewritten");

  // Bytes below the buffer size only reach the file on close.
  const fs::path c = dir / "c.csv";
  expect(w.open(c.string()) && w.append("tiny"), "open c");
  expect(w.close() && cs_test::read_file(c) == "tiny", "close flushes");

  cs::ChunkWriter bad;
  expect(!bad.open((dir / "missing-dir" / "x.csv").string()), "open in missing dir fails");
  expect(bad.last_error() != 0, "errno kept");

  // Destructor releases an open handle.
  {
    cs::ChunkWriter scoped(cfg);
    expect(scoped.open((dir / "d.csv").string()), "open d");
  }
  expect(fs::exists(dir / "d.csv"), "d created");

  // Bytes still in the writer's buffer are discarded by the destructor.
  {
    cs::ChunkWriter::Config big;
    big.buffer_bytes = 4096;
    cs::ChunkWriter scoped(big);
    expect(scoped.open((dir / "e.csv").string()) && scoped.append("pending\n"), "open e");
  }
  expect(fs::exists(dir / "e.csv") && fs::file_size(dir / "e.csv") == 0, "unclosed buffer discarded");

  fs::remove_all(dir);
  return cs_test::report("chunk_writer");
}
