#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace cs {

// Maps a 1-based part index to the file that part is written to.
using PartNamer = std::function<std::filesystem::path(std::uint32_t index)>;

struct PartNamerConfig {
  int width = 3;                     // zero-pad width; wider indices just grow
  std::filesystem::path out_dir;     // empty -> next to the input file
};

// Split a file name at its last '.': "data.csv" -> {"data", ".csv"},
// "archive.tar.gz" -> {"archive.tar", ".gz"}, "README" -> {"README", ""}.
std::pair<std::string, std::string> split_extension(std::string_view filename);

// "<base>_part<NNN><ext>" for `index`.
std::string part_file_name(std::string_view input_filename, std::uint32_t index, int width = 3);

// Default naming strategy: <dir>/<base>_part<NNN><ext>, where <dir> is
// cfg.out_dir or the input's parent directory.
PartNamer make_part_namer(const std::filesystem::path& input, PartNamerConfig cfg = {});

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

}
