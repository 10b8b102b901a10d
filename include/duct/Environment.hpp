#pragma once

#include <map>
#include <string>
#include <vector>

#include "duct/Syscall.hpp"

namespace duct {

using EnvMap = std::map<std::string, std::string>;

} // namespace duct

namespace duct::core {

// Copy of the calling process' environment. Taken once per evaluation; later
// changes to the process environment do not affect an evaluation in flight.
auto environment_snapshot() -> EnvMap;

// setenv()/unsetenv() serialized against environment_snapshot().
auto set_variable(std::string const& name, std::string const& value) -> syscall::Result<void>;
auto unset_variable(std::string const& name) -> syscall::Result<void>;

// "NAME=value" strings plus the null-terminated pointer array execve() expects.
class EnvBlock {
  std::vector<std::string> entries_;
  std::vector<char*>       pointers_;

public:
  explicit EnvBlock(EnvMap const& env);

  EnvBlock(EnvBlock const&)            = delete;
  EnvBlock& operator=(EnvBlock const&) = delete;
  EnvBlock(EnvBlock&&)                 = default;
  EnvBlock& operator=(EnvBlock&&)      = default;
  ~EnvBlock()                          = default;

  [[nodiscard]] char* const* data() const noexcept {
    return pointers_.data();
  }

  [[nodiscard]] std::vector<std::string> const& entries() const noexcept {
    return entries_;
  }
};

} // namespace duct::core
