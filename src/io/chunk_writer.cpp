#include "csv_splitter/chunk_writer.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace cs {

struct ChunkWriter::Impl {
  Config cfg;
  std::string path;
  FILE* f{nullptr};
  std::vector<char> buf;
  std::size_t used{0};
  int last_errno{0};
  std::uint64_t bytes{0};

  bool flush() {
    if (used == 0) return true;
    if (std::fwrite(buf.data(), 1, used, f) != used) {
      last_errno = errno ? errno : EIO;
      return false;
    }
    used = 0;
    return true;
  }

  bool append(std::string_view s) {
    if (!f) { last_errno = EBADF; return false; }
    bytes += s.size();
    while (!s.empty()) {
      if (used == buf.size() && !flush()) return false;
      const std::size_t take = std::min(buf.size() - used, s.size());
      std::memcpy(buf.data() + used, s.data(), take);
      used += take;
      s.remove_prefix(take);
    }
    return true;
  }
};

ChunkWriter::ChunkWriter() : ChunkWriter(Config{}) {}

ChunkWriter::ChunkWriter(Config cfg) : p_(new Impl{cfg}) {
  if (p_->cfg.buffer_bytes == 0) p_->cfg.buffer_bytes = 1;
  p_->buf.resize(p_->cfg.buffer_bytes);
}

ChunkWriter::~ChunkWriter() {
  if (p_->f) std::fclose(p_->f);
  delete p_;
}

bool ChunkWriter::open(const std::string& path) {
  if (p_->f) { p_->last_errno = EBUSY; return false; }
  p_->path = path;
  p_->used = 0;
  p_->bytes = 0;
  p_->f = std::fopen(path.c_str(), "wb");
  if (!p_->f) { p_->last_errno = errno; return false; }
  return true;
}

bool ChunkWriter::append(std::string_view bytes) { return p_->append(bytes); }

bool ChunkWriter::close() {
  if (!p_->f) { p_->last_errno = EBADF; return false; }
  bool ok = p_->flush();
  if (std::fclose(p_->f) != 0 && ok) { p_->last_errno = errno; ok = false; }
  p_->f = nullptr;
  p_->used = 0;
  return ok;
}

bool ChunkWriter::is_open() const noexcept { return p_->f != nullptr; }
int  ChunkWriter::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkWriter::bytes_written() const noexcept { return p_->bytes; }
const std::string& ChunkWriter::path() const noexcept { return p_->path; }

}
