#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "duct/Output.hpp"

namespace duct {

enum class ErrorKind {
  SpawnFailure,  // executable missing, permission denied, bad working directory
  StatusFailure, // checked child exited unsuccessfully
  IoFailure,     // stream open/read/write failure
  InvalidUtf8,   // read() on output that is not text
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

class Error {
  ErrorKind             kind_;
  std::string           message_;
  int                   error_code_ = 0;
  std::optional<Output> output_;

public:
  Error(ErrorKind kind, std::string message, int error_code = 0);

  // Errno-carrying failures; the message gets strerror() appended.
  [[nodiscard]] static Error spawn(std::string_view what, int error_code);
  [[nodiscard]] static Error io(std::string_view what, int error_code);
  [[nodiscard]] static Error status(Output output);
  [[nodiscard]] static Error invalid_utf8(std::string_view what);

  [[nodiscard]] ErrorKind          kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;
  [[nodiscard]] int                error_code() const noexcept;

  // Populated for StatusFailure.
  [[nodiscard]] std::optional<Output> const& output() const noexcept;

  [[nodiscard]] std::string to_string() const;
};

template<typename T>
using Result = std::expected<T, Error>;

} // namespace duct
