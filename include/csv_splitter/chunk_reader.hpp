#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cs {

// Pull-based reader over one file: fixed-size chunks starting at an offset.
// Not restartable; the file is closed once next() reports end of stream.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 8 * 1024 * 1024;  // 8 MiB
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config

  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Open the file and seek to `offset`. False on open/seek failure.
  bool open(std::uint64_t offset = 0);

  // Next non-empty chunk, valid until the following call. False at end of
  // stream or on a read error; failed() tells them apart.
  bool next(std::string_view& out);

  bool failed() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t position() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
