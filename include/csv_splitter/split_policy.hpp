#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace cs {

struct SplitError;

struct SplitPolicy {
  enum class Kind { ByLines, ByMaxSize, ByPartCount };

  Kind kind = Kind::ByLines;
  std::uint64_t limit = 0;   // lines, bytes, or parts depending on kind

  static SplitPolicy by_lines(std::uint64_t n)       { return {Kind::ByLines, n}; }
  static SplitPolicy by_max_size(std::uint64_t b)    { return {Kind::ByMaxSize, b}; }
  static SplitPolicy by_part_count(std::uint64_t k)  { return {Kind::ByPartCount, k}; }

  // Every kind needs limit >= 1.
  bool validate(SplitError* err) const;

  // ByPartCount(k) -> ByMaxSize(max(1, ceil(data_bytes / k))); other kinds
  // are returned unchanged.
  SplitPolicy resolve(std::uint64_t data_bytes) const;
};

// How strictly ByMaxSize honours its limit.
enum class SizeCap {
  Approximate,  // checked per read chunk; may overshoot by < one chunk
  Exact         // chunk is cut at the limit
};

std::string_view to_string(SplitPolicy::Kind k) noexcept;
std::string_view to_string(SizeCap c) noexcept;

// "lines=1000", "max_size=10.0 MB", "parts=4"
std::string describe(const SplitPolicy& p);

}
