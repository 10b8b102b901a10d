#include "duct/FileDescriptor.hpp"
#include "duct/Syscall.hpp"

#include <cerrno>
#include <expected>

namespace duct::core {

FileDescriptor::FileDescriptor(int fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = -1;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_, other.owning_);
    other.fd_     = -1;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::get() const noexcept -> int {
  return fd_;
}

auto FileDescriptor::owning() const noexcept -> bool {
  return owning_;
}

auto FileDescriptor::release() noexcept -> int {
  int fd  = fd_;
  fd_     = -1;
  owning_ = false;
  return fd;
}

void FileDescriptor::reset(int fd, bool owning) noexcept {
  if (owning_ && fd_ >= 0) {
    // Ignore errors, the descriptor is invalid afterwards either way
    [[maybe_unused]] auto _ = syscall::close_fd(fd_);
  }
  fd_     = fd;
  owning_ = owning;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ >= 0;
}

auto FileDescriptor::try_clone() const -> syscall::Result<FileDescriptor> {
  if (!valid()) {
    return std::unexpected(EBADF);
  }
  auto dup_result = syscall::duplicate_fd(fd_);
  if (!dup_result) {
    return std::unexpected(dup_result.error());
  }
  return FileDescriptor{*dup_result};
}

auto make_pipe() -> syscall::Result<PipePair> {
  auto pipe_result = syscall::create_pipe();
  if (!pipe_result) {
    return std::unexpected(pipe_result.error());
  }
  auto fds = *pipe_result;
  return PipePair{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

} // namespace duct::core
