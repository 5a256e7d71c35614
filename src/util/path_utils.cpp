#include "csv_splitter/path_utils.hpp"
#include <iomanip>
#include <sstream>

namespace cs {

std::pair<std::string, std::string> split_extension(std::string_view filename) {
  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos) return {std::string(filename), std::string()};
  return {std::string(filename.substr(0, dot)), std::string(filename.substr(dot))};
}

std::string part_file_name(std::string_view input_filename, std::uint32_t index, int width) {
  auto [base, ext] = split_extension(input_filename);
  std::ostringstream o;
  o << base << "_part" << std::setw(width) << std::setfill('0') << index << ext;
  return o.str();
}

PartNamer make_part_namer(const std::filesystem::path& input, PartNamerConfig cfg) {
  const std::string filename = input.filename().string();
  const std::filesystem::path dir = cfg.out_dir.empty() ? input.parent_path() : cfg.out_dir;
  const int width = cfg.width;
  return [filename, dir, width](std::uint32_t index) {
    return dir / part_file_name(filename, index, width);
  };
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

}
