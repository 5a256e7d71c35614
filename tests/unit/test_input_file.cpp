#include "csv_splitter/input_file.hpp"
#include "csv_splitter/split_error.hpp"
#include "test_support.hpp"

#include <string>

using cs_test::expect;

int main() {
  const fs::path dir = cs_test::scratch_dir("input");

  {
    const fs::path f = dir / "lf.csv";
    cs_test::write_file(f, "id,name\n1,a\n2,b\n");
    cs::InputFile in; cs::SplitError err;
    expect(cs::load_input_file(f.string(), &in, &err), "load lf");
    expect(in.header == "id,name", "lf header");
    expect(in.header_raw == "id,name\n", "lf raw header");
    expect(in.header_bytes == 8, "lf header bytes");
    expect(in.file_size == 16 && in.data_bytes() == 8, "lf sizes");
  }
  {
    const fs::path f = dir / "crlf.csv";
    cs_test::write_file(f, "id,name\r\n1,a\r\n");
    cs::InputFile in; cs::SplitError err;
    expect(cs::load_input_file(f.string(), &in, &err), "load crlf");
    expect(in.header == "id,name", "crlf header stripped");
    expect(in.header_raw == "id,name\r\n" && in.header_bytes == 9, "crlf raw header kept");
  }
  {
    const fs::path f = dir / "only_header.csv";
    cs_test::write_file(f, "a,b,c");
    cs::InputFile in; cs::SplitError err;
    expect(cs::load_input_file(f.string(), &in, &err), "load unterminated header");
    expect(in.header == "a,b,c" && in.header_bytes == 5 && in.data_bytes() == 0, "unterminated header");
  }
  {
    // Header longer than the header scan chunk.
    const std::string wide(200000, 'h');
    const fs::path f = dir / "wide.csv";
    cs_test::write_file(f, wide + "\nrow\n");
    cs::InputFile in; cs::SplitError err;
    expect(cs::load_input_file(f.string(), &in, &err), "load wide");
    expect(in.header == wide && in.header_bytes == wide.size() + 1, "wide header");
  }
  {
    const fs::path f = dir / "empty.csv";
    cs_test::write_file(f, "");
    cs::InputFile in; cs::SplitError err;
    expect(!cs::load_input_file(f.string(), &in, &err), "empty fails");
    expect(err.kind == cs::ErrorKind::EmptyInput, "empty -> EmptyInput");
  }
  {
    cs::InputFile in; cs::SplitError err;
    expect(!cs::load_input_file((dir / "absent.csv").string(), &in, &err), "absent fails");
    expect(err.kind == cs::ErrorKind::IOError, "absent -> IOError");
  }

  fs::remove_all(dir);
  return cs_test::report("input_file");
}
