#pragma once
#include <cstdint>
#include <string>

namespace cs {

struct SplitError;

struct InputFile {
  std::string path;
  std::uint64_t file_size = 0;
  std::string header;        // first line, no '\n' / "\r\n"
  std::string header_raw;    // first line exactly as stored, terminator included
  std::uint64_t header_bytes = 0;

  std::uint64_t data_bytes() const noexcept {
    return file_size > header_bytes ? file_size - header_bytes : 0;
  }
};

// Stat the file and capture its header line. A zero-byte file has no header
// and yields EmptyInput; open/read failures yield IOError.
bool load_input_file(const std::string& path, InputFile* out, SplitError* err);

}
