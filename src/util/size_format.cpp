#include "csv_splitter/size_format.hpp"
#include "csv_splitter/split_error.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <fast_float/fast_float.h>

namespace cs {

namespace {

constexpr std::uint64_t KiB = 1024ull;

bool fail(SplitError* err, std::string msg) {
  if (err) err->set(ErrorKind::InvalidArgument, std::move(msg));
  return false;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
  return s;
}

// 0 for an unknown unit.
std::uint64_t unit_multiplier(std::string_view unit) {
  if (unit.empty()) return 1;
  if (unit.size() > 2) return 0;
  if (unit.size() == 2 && std::toupper(static_cast<unsigned char>(unit[1])) != 'B') return 0;
  switch (std::toupper(static_cast<unsigned char>(unit[0]))) {
    case 'K': return KiB;
    case 'M': return KiB * KiB;
    case 'G': return KiB * KiB * KiB;
    case 'T': return KiB * KiB * KiB * KiB;
    default:  return 0;
  }
}

}

std::string format_size(std::uint64_t bytes) {
  static constexpr const char* units[] = {"KB", "MB", "GB", "TB"};
  if (bytes < KiB) return std::to_string(bytes) + " B";
  double v = static_cast<double>(bytes) / KiB;
  int u = 0;
  while (v >= 1024.0 && u < 3) { v /= 1024.0; ++u; }
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  return buf;
}

bool parse_size(std::string_view text, std::uint64_t* out, SplitError* err) {
  const std::string_view s = trim(text);
  const std::string shown(text);
  if (s.empty()) return fail(err, "Invalid size format: empty. Examples: 1024, 10K, 100MB, 1GB");

  // <digits>[.<digits>]
  std::size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  const std::size_t int_end = i;
  bool fractional = false;
  if (i < s.size() && s[i] == '.') {
    fractional = true;
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  }
  if (int_end == 0 || (fractional && i == int_end + 1)) {
    return fail(err, "Invalid size format '" + shown + "'. Examples: 1024, 10K, 100MB, 1GB");
  }
  const std::string_view number = s.substr(0, i);
  const std::string_view unit = trim(s.substr(i));

  const std::uint64_t mult = unit_multiplier(unit);
  if (mult == 0) return fail(err, "Invalid size unit: " + std::string(unit));

  std::uint64_t bytes = 0;
  if (!fractional) {
    std::uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), n);
    if (ec != std::errc() || ptr != number.data() + number.size()) {
      return fail(err, "Size out of range: " + shown);
    }
    if (n > std::numeric_limits<std::uint64_t>::max() / mult) {
      return fail(err, "Size out of range: " + shown);
    }
    bytes = n * mult;
  } else {
    double d = 0.0;
    auto [ptr, ec] = fast_float::from_chars(number.data(), number.data() + number.size(), d);
    if (ec != std::errc() || ptr != number.data() + number.size()) {
      return fail(err, "Invalid size format '" + shown + "'");
    }
    const double scaled = std::floor(d * static_cast<double>(mult));
    // 2^64 is exactly representable; anything at or above it overflows.
    if (!std::isfinite(scaled) || scaled >= 18446744073709551616.0) {
      return fail(err, "Size out of range: " + shown);
    }
    bytes = static_cast<std::uint64_t>(scaled);
  }

  *out = bytes;
  return true;
}

bool parse_count(std::string_view text, std::uint64_t* out, SplitError* err) {
  const std::string_view s = trim(text);
  std::uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
    return fail(err, "Expected a positive integer, got '" + std::string(text) + "'");
  }
  *out = n;
  return true;
}

}
