#include "csv_splitter/split_policy.hpp"
#include "csv_splitter/size_format.hpp"
#include "csv_splitter/split_error.hpp"

namespace cs {

bool SplitPolicy::validate(SplitError* err) const {
  if (limit >= 1) return true;
  if (!err) return false;
  switch (kind) {
    case Kind::ByLines:     err->set(ErrorKind::InvalidArgument, "Lines per part must be positive"); break;
    case Kind::ByMaxSize:   err->set(ErrorKind::InvalidArgument, "Max size must be positive"); break;
    case Kind::ByPartCount: err->set(ErrorKind::InvalidArgument, "Number of parts must be positive"); break;
  }
  return false;
}

SplitPolicy SplitPolicy::resolve(std::uint64_t data_bytes) const {
  if (kind != Kind::ByPartCount || limit == 0) return *this;
  std::uint64_t per_part = data_bytes / limit + (data_bytes % limit != 0 ? 1 : 0);
  if (per_part == 0) per_part = 1;
  return by_max_size(per_part);
}

std::string_view to_string(SplitPolicy::Kind k) noexcept {
  switch (k) {
    case SplitPolicy::Kind::ByLines:     return "lines";
    case SplitPolicy::Kind::ByMaxSize:   return "max_size";
    case SplitPolicy::Kind::ByPartCount: return "parts";
  }
  return "unknown";
}

std::string_view to_string(SizeCap c) noexcept {
  return c == SizeCap::Exact ? "exact" : "approximate";
}

std::string describe(const SplitPolicy& p) {
  std::string s(to_string(p.kind));
  s += '=';
  s += (p.kind == SplitPolicy::Kind::ByMaxSize) ? format_size(p.limit) : std::to_string(p.limit);
  return s;
}

}
