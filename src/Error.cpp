#include "duct/Error.hpp"

#include <cstring>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace duct {

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::SpawnFailure: return "spawn failure";
    case ErrorKind::StatusFailure: return "status failure";
    case ErrorKind::IoFailure: return "I/O failure";
    case ErrorKind::InvalidUtf8: return "invalid UTF-8";
  }
  return "unknown error";
}

Error::Error(ErrorKind kind, std::string message, int error_code)
    : kind_(kind), message_(std::move(message)), error_code_(error_code) {}

Error Error::spawn(std::string_view what, int error_code) {
  return Error{ErrorKind::SpawnFailure, fmt::format("{}: {}", what, std::strerror(error_code)), error_code};
}

Error Error::io(std::string_view what, int error_code) {
  return Error{ErrorKind::IoFailure, fmt::format("{}: {}", what, std::strerror(error_code)), error_code};
}

Error Error::status(Output output) {
  Error error{ErrorKind::StatusFailure, fmt::format("command failed with {}", output.status_.to_string())};
  error.output_ = std::move(output);
  return error;
}

Error Error::invalid_utf8(std::string_view what) {
  return Error{ErrorKind::InvalidUtf8, std::string{what}};
}

ErrorKind Error::kind() const noexcept {
  return kind_;
}

std::string const& Error::message() const noexcept {
  return message_;
}

int Error::error_code() const noexcept {
  return error_code_;
}

std::optional<Output> const& Error::output() const noexcept {
  return output_;
}

std::string Error::to_string() const {
  return fmt::format("{}: {}", duct::to_string(kind_), message_);
}

} // namespace duct
