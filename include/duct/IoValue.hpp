#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <variant>

#include "duct/Error.hpp"
#include "duct/FileDescriptor.hpp"

namespace duct {

enum class Stream {
  Stdin,
  Stdout,
  Stderr,
};

[[nodiscard]] std::string_view to_string(Stream stream) noexcept;

// A place a child stream can be connected to.
//
// Null and Path are plain values, opened when a child is spawned. Owned and
// PipeEnd hold a descriptor closed by this object; Borrowed never closes.
class IoValue {
public:
  struct Null {};
  struct Path {
    std::filesystem::path path_;
  };
  struct Owned {
    core::FileDescriptor fd_;
  };
  struct Borrowed {
    int fd_;
  };
  struct PipeEnd {
    core::FileDescriptor fd_;
  };

  using Variant = std::variant<Null, Path, Owned, Borrowed, PipeEnd>;

private:
  Variant value_;

  explicit IoValue(Variant value) noexcept;

public:
  IoValue() noexcept;

  IoValue(IoValue const&)                = delete;
  IoValue& operator=(IoValue const&)     = delete;
  IoValue(IoValue&&) noexcept            = default;
  IoValue& operator=(IoValue&&) noexcept = default;
  ~IoValue()                             = default;

  [[nodiscard]] static IoValue null() noexcept;
  [[nodiscard]] static IoValue path(std::filesystem::path path);
  [[nodiscard]] static IoValue owned(core::FileDescriptor fd) noexcept;
  [[nodiscard]] static IoValue borrowed(int fd) noexcept;
  [[nodiscard]] static IoValue pipe_end(core::FileDescriptor fd) noexcept;

  // Independent value for the same target: descriptors are dup'ed, so either
  // copy can be closed without affecting the other. A borrowed descriptor stays
  // borrowed.
  [[nodiscard]] Result<IoValue> try_clone() const;

  // Descriptor to hand to a child for `stream`. Null and Path are opened here
  // (relative paths against `dir`); handle variants are returned as
  // non-owning views, valid while this IoValue lives.
  [[nodiscard]] Result<core::FileDescriptor>
  open_for(Stream stream, std::optional<std::filesystem::path> const& dir) const;

  template<typename T>
  [[nodiscard]] bool holds() const noexcept {
    return std::holds_alternative<T>(value_);
  }

  [[nodiscard]] Variant const& value() const noexcept {
    return value_;
  }
};

} // namespace duct
