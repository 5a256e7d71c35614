#include "csv_splitter/input_file.hpp"
#include "csv_splitter/chunk_reader.hpp"
#include "csv_splitter/split_error.hpp"

#include <filesystem>
#include <system_error>

namespace cs {

bool load_input_file(const std::string& path, InputFile* out, SplitError* err) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    err->set(ErrorKind::IOError, io_message("cannot stat", path, ec.value()));
    return false;
  }
  if (size == 0) {
    err->set(ErrorKind::EmptyInput, "Empty CSV file '" + path + "': no header line");
    return false;
  }

  ChunkReader::Config rcfg;
  rcfg.chunk_bytes = 64 * 1024;
  ChunkReader reader(path, rcfg);
  if (!reader.open()) {
    err->set(ErrorKind::IOError, io_message("cannot open", path, reader.last_error()));
    return false;
  }

  std::string raw;
  bool terminated = false;
  std::string_view chunk;
  while (!terminated && reader.next(chunk)) {
    const auto nl = chunk.find('\n');
    if (nl == std::string_view::npos) {
      raw.append(chunk);
    } else {
      raw.append(chunk.substr(0, nl + 1));
      terminated = true;
    }
  }
  if (reader.failed()) {
    err->set(ErrorKind::IOError, io_message("read failed on", path, reader.last_error()));
    return false;
  }

  InputFile in;
  in.path = path;
  in.file_size = size;
  in.header_bytes = raw.size();
  in.header = raw;
  if (!in.header.empty() && in.header.back() == '\n') in.header.pop_back();
  if (!in.header.empty() && in.header.back() == '\r') in.header.pop_back();
  in.header_raw = std::move(raw);
  *out = std::move(in);
  return true;
}

}
