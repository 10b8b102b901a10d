#include "duct/Util.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace duct::util {

void strip_trailing_newline(std::string& text) noexcept {
  if (text.ends_with("\r\n")) {
    text.resize(text.size() - 2);
  } else if (text.ends_with('\n')) {
    text.pop_back();
  }
}

bool is_valid_utf8(std::string_view bytes) noexcept {
  size_t i = 0;
  while (i < bytes.size()) {
    auto lead = static_cast<std::uint8_t>(bytes[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t        length = 0;
    std::uint32_t code   = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code   = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code   = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code   = lead & 0x07;
    } else {
      return false;
    }

    if (i + length > bytes.size()) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      auto cont = static_cast<std::uint8_t>(bytes[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code = (code << 6) | (cont & 0x3F);
    }

    // overlong encodings, surrogates, out of range
    if ((length == 2 && code < 0x80) || (length == 3 && code < 0x800) || (length == 4 && code < 0x10000)) {
      return false;
    }
    if ((code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF) {
      return false;
    }
    i += length;
  }
  return true;
}

std::string quote(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 2);
  result.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"': result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          result += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        } else {
          result.push_back(c);
        }
    }
  }
  result.push_back('"');
  return result;
}

} // namespace duct::util
