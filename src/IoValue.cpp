#include "duct/IoValue.hpp"
#include "duct/Constants.hpp"
#include "duct/Syscall.hpp"
#include "duct/Util.hpp"

#include <expected>
#include <string>
#include <utility>

#include <fcntl.h>
#include <fmt/core.h>

namespace duct {

namespace {

int open_flags(Stream stream) noexcept {
  return stream == Stream::Stdin ? O_RDONLY : O_WRONLY | O_CREAT | O_TRUNC;
}

Result<core::FileDescriptor> open_path(std::filesystem::path const& path, Stream stream) {
  auto fd = core::syscall::open_file(path.string(), open_flags(stream), CREATE_FILE_MODE);
  if (!fd) {
    return std::unexpected(Error::io(fmt::format("failed to open {} for {}", path.string(), to_string(stream)), fd.error()));
  }
  return core::FileDescriptor{*fd};
}

} // namespace

std::string_view to_string(Stream stream) noexcept {
  switch (stream) {
    case Stream::Stdin: return "stdin";
    case Stream::Stdout: return "stdout";
    case Stream::Stderr: return "stderr";
  }
  return "unknown stream";
}

IoValue::IoValue(Variant value) noexcept
    : value_(std::move(value)) {}

IoValue::IoValue() noexcept
    : value_(Null{}) {}

IoValue IoValue::null() noexcept {
  return IoValue{Null{}};
}

IoValue IoValue::path(std::filesystem::path path) {
  return IoValue{Path{std::move(path)}};
}

IoValue IoValue::owned(core::FileDescriptor fd) noexcept {
  return IoValue{Owned{std::move(fd)}};
}

IoValue IoValue::borrowed(int fd) noexcept {
  return IoValue{Borrowed{fd}};
}

IoValue IoValue::pipe_end(core::FileDescriptor fd) noexcept {
  return IoValue{PipeEnd{std::move(fd)}};
}

Result<IoValue> IoValue::try_clone() const {
  auto clone_fd = [](core::FileDescriptor const& fd) -> Result<core::FileDescriptor> {
    auto cloned = fd.try_clone();
    if (!cloned) {
      return std::unexpected(Error::io(fmt::format("failed to duplicate descriptor {}", fd.get()), cloned.error()));
    }
    return std::move(*cloned);
  };

  return std::visit(
      util::Overloaded{
          [](Null const&) -> Result<IoValue> { return IoValue::null(); },
          [](Path const& p) -> Result<IoValue> { return IoValue::path(p.path_); },
          [](Borrowed const& b) -> Result<IoValue> { return IoValue::borrowed(b.fd_); },
          [&](Owned const& o) -> Result<IoValue> {
            auto fd = clone_fd(o.fd_);
            if (!fd) {
              return std::unexpected(std::move(fd.error()));
            }
            return IoValue::owned(std::move(*fd));
          },
          [&](PipeEnd const& p) -> Result<IoValue> {
            auto fd = clone_fd(p.fd_);
            if (!fd) {
              return std::unexpected(std::move(fd.error()));
            }
            return IoValue::pipe_end(std::move(*fd));
          },
      },
      value_
  );
}

Result<core::FileDescriptor>
IoValue::open_for(Stream stream, std::optional<std::filesystem::path> const& dir) const {
  return std::visit(
      util::Overloaded{
          [&](Null const&) { return open_path(std::string{NULL_DEVICE}, stream); },
          [&](Path const& p) {
            if (p.path_.is_relative() && dir.has_value()) {
              return open_path(*dir / p.path_, stream);
            }
            return open_path(p.path_, stream);
          },
          [](Borrowed const& b) -> Result<core::FileDescriptor> { return core::FileDescriptor{b.fd_, false}; },
          [](Owned const& o) -> Result<core::FileDescriptor> { return core::FileDescriptor{o.fd_.get(), false}; },
          [](PipeEnd const& p) -> Result<core::FileDescriptor> { return core::FileDescriptor{p.fd_.get(), false}; },
      },
      value_
  );
}

} // namespace duct
