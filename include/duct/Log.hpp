#pragma once

#include <cstdio>
#include <utility>

#include <fmt/core.h>

namespace duct::log {

// Tracing is enabled when DUCT_VERBOSE is set (and not "0") at first use.
[[nodiscard]] bool verbose() noexcept;
void               set_verbose(bool enabled) noexcept;

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (!verbose()) {
    return;
  }
  fmt::print(stderr, "duct: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

// Failures that cannot be returned to the caller.
template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  fmt::print(stderr, "duct: warning: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace duct::log
