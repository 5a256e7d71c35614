#include "csv_splitter/path_utils.hpp"
#include "test_support.hpp"

using cs_test::expect;

int main() {
  expect(cs::part_file_name("data.csv", 1) == "data_part001.csv", "basic name");
  expect(cs::part_file_name("data.csv", 42) == "data_part042.csv", "two digit index");
  expect(cs::part_file_name("data.csv", 1000) == "data_part1000.csv", "index overflows width");
  expect(cs::part_file_name("archive.tar.gz", 3) == "archive.tar_part003.gz", "last dot wins");
  expect(cs::part_file_name("README", 7) == "README_part007", "no extension");
  expect(cs::part_file_name("x.csv", 5, 5) == "x_part00005.csv", "custom width");

  auto [base, ext] = cs::split_extension("report.final.csv");
  expect(base == "report.final" && ext == ".csv", "split_extension");

  const fs::path in = fs::path("some") / "dir" / "big.csv";
  auto sibling = cs::make_part_namer(in);
  expect(sibling(2) == fs::path("some") / "dir" / "big_part002.csv", "sibling namer: " + sibling(2).string());

  cs::PartNamerConfig cfg;
  cfg.out_dir = "out";
  auto into_dir = cs::make_part_namer(in, cfg);
  expect(into_dir(12) == fs::path("out") / "big_part012.csv", "out_dir namer: " + into_dir(12).string());

  const fs::path dir = cs_test::scratch_dir("paths");
  const fs::path nested = dir / "a" / "b" / "file.json";
  expect(cs::ensure_parent_dirs(nested), "ensure_parent_dirs");
  expect(fs::is_directory(dir / "a" / "b"), "parent created");
  fs::remove_all(dir);

  return cs_test::report("path_utils");
}
