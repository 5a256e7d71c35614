#include "csv_splitter/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <new>
#include <stdexcept>
#include <sys/types.h>
#include <vector>

namespace cs {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  std::vector<char> buf;
  int last_errno{0};
  bool failed{false};
  bool exhausted{false};
  std::uint64_t bytes{0};
  std::uint64_t pos{0};

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  bool open(std::uint64_t offset) {
    if (f || exhausted) { failed = true; last_errno = EBUSY; return false; }
    f = std::fopen(path.c_str(), "rb");
    if (!f) { failed = true; last_errno = errno; return false; }
    if (offset > 0) {
      // fseeko keeps 64-bit offsets on 32-bit off_t builds too
      if (fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
        failed = true; last_errno = errno; close(); return false;
      }
    }
    pos = offset;
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    try {
      buf.resize(cfg.chunk_bytes);
    } catch (const std::bad_alloc&) {
      failed = true; last_errno = ENOMEM; close(); return false;
    } catch (const std::length_error&) {
      failed = true; last_errno = ENOMEM; close(); return false;
    }
    return true;
  }

  bool next(std::string_view& out) {
    if (!f) return false;
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) { failed = true; last_errno = errno ? errno : EIO; }
      close();
      exhausted = true;
      return false;
    }
    bytes += n;
    pos += n;
    out = std::string_view(buf.data(), n);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { p_->close(); delete p_; }

bool ChunkReader::open(std::uint64_t offset) { return p_->open(offset); }
bool ChunkReader::next(std::string_view& out) { return p_->next(out); }
bool ChunkReader::failed() const noexcept { return p_->failed; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::position() const noexcept { return p_->pos; }
const std::string& ChunkReader::path() const noexcept { return p_->path; }

}
