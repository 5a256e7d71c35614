#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cs {

// Buffered byte sink over one output file. One writer can be reopened for
// successive parts; its buffer is reused.
class ChunkWriter {
public:
  struct Config {
    std::size_t buffer_bytes = 8 * 1024 * 1024;  // 8 MiB
  };

  ChunkWriter();                      // uses default Config{}
  explicit ChunkWriter(Config cfg);
  ~ChunkWriter();                     // closes an unclosed handle; bytes still in the writer's buffer are discarded

  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;

  // Create or truncate `path`. Fails if a file is already open.
  bool open(const std::string& path);

  // Buffer bytes, flushing to the file whenever the buffer fills.
  bool append(std::string_view bytes);

  // Flush everything buffered and close. Exactly once per open().
  bool close();

  bool is_open() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_written() const noexcept;  // since open(), incl. buffered
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
