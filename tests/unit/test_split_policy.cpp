#include "csv_splitter/split_error.hpp"
#include "csv_splitter/split_policy.hpp"
#include "test_support.hpp"

using cs_test::expect;
using Kind = cs::SplitPolicy::Kind;

int main() {
  cs::SplitError err;
  expect(cs::SplitPolicy::by_lines(1).validate(&err), "lines=1 valid");
  expect(!cs::SplitPolicy::by_lines(0).validate(&err) && err.kind == cs::ErrorKind::InvalidArgument, "lines=0");
  err.clear();
  expect(!cs::SplitPolicy::by_max_size(0).validate(&err) && err.kind == cs::ErrorKind::InvalidArgument, "size=0");
  err.clear();
  expect(!cs::SplitPolicy::by_part_count(0).validate(&err) && err.kind == cs::ErrorKind::InvalidArgument, "parts=0");

  // ceil(100 / 3) = 34
  auto r = cs::SplitPolicy::by_part_count(3).resolve(100);
  expect(r.kind == Kind::ByMaxSize && r.limit == 34, "parts=3 over 100 bytes");
  r = cs::SplitPolicy::by_part_count(4).resolve(100);
  expect(r.limit == 25, "parts=4 divides evenly");
  r = cs::SplitPolicy::by_part_count(10).resolve(3);
  expect(r.limit == 1, "more parts than bytes");
  r = cs::SplitPolicy::by_part_count(5).resolve(0);
  expect(r.limit == 1, "no data clamps to one byte");
  r = cs::SplitPolicy::by_part_count(1).resolve(~0ull);
  expect(r.limit == ~0ull, "no overflow on huge data");

  r = cs::SplitPolicy::by_lines(7).resolve(1000);
  expect(r.kind == Kind::ByLines && r.limit == 7, "lines unchanged");

  expect(cs::describe(cs::SplitPolicy::by_lines(1000)) == "lines=1000", "describe lines");
  expect(cs::describe(cs::SplitPolicy::by_max_size(10ull << 20)) == "max_size=10.0 MB", "describe size");
  expect(cs::describe(cs::SplitPolicy::by_part_count(4)) == "parts=4", "describe parts");
  expect(cs::to_string(cs::SizeCap::Exact) == "exact", "cap name");

  return cs_test::report("split_policy");
}
