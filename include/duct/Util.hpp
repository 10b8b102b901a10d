#pragma once

#include <string>
#include <string_view>

namespace duct::util {

// Visitor built from a set of lambdas, for std::visit.
template<typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

// Removes one trailing "\n" or "\r\n", if present.
void strip_trailing_newline(std::string& text) noexcept;

[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

// Double-quoted with backslash escapes, for diagnostics.
[[nodiscard]] std::string quote(std::string_view s);

} // namespace duct::util
