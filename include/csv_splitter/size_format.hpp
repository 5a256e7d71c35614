#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace cs {

struct SplitError;

// Human-readable size: "512 B", "10.0 KB", "1.5 MB", "2.0 GB", "1.0 TB".
std::string format_size(std::uint64_t bytes);

// Parse "<number>[ ]<unit>" where unit is K|KB|M|MB|G|GB|T|TB (1024-based,
// case-insensitive) or absent (bytes). A decimal mantissa ("1.5G") is
// accepted and truncated to whole bytes. Returns false and fills `err` with
// InvalidArgument on malformed input, unknown unit, or overflow.
bool parse_size(std::string_view text, std::uint64_t* out, SplitError* err = nullptr);

// Plain positive integer (line / part counts). Rejects signs and suffixes.
bool parse_count(std::string_view text, std::uint64_t* out, SplitError* err = nullptr);

}
