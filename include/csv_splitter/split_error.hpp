#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace cs {

enum class ErrorKind { None, InvalidArgument, EmptyInput, IOError };

struct SplitError {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const noexcept { return kind == ErrorKind::None; }
  void set(ErrorKind k, std::string msg) { kind = k; message = std::move(msg); }
  void clear() { kind = ErrorKind::None; message.clear(); }
};

std::string_view to_string(ErrorKind k) noexcept;

// "<message>: <strerror(err)>" for I/O failures carrying an errno.
std::string io_message(std::string_view what, std::string_view path, int err);

}
