#include "csv_splitter/split_error.hpp"
#include <cstring>

namespace cs {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:            return "ok";
    case ErrorKind::InvalidArgument: return "invalid argument";
    case ErrorKind::EmptyInput:      return "empty input";
    case ErrorKind::IOError:         return "I/O error";
  }
  return "unknown";
}

std::string io_message(std::string_view what, std::string_view path, int err) {
  std::string m(what);
  m += " '";
  m += path;
  m += "'";
  if (err != 0) {
    m += ": ";
    m += std::strerror(err);
  }
  return m;
}

}
