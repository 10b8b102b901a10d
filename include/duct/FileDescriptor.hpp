#pragma once

#include <utility>

#include "duct/Syscall.hpp"

namespace duct::core {

// Owning or borrowing wrapper around a raw descriptor. A borrowed descriptor is
// never closed by the wrapper.
class FileDescriptor {
  int  fd_;
  bool owning_;

public:
  explicit FileDescriptor(int fd = -1, bool owning = true) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] auto get() const noexcept -> int;
  [[nodiscard]] auto owning() const noexcept -> bool;
  auto               release() noexcept -> int;
  void               reset(int fd = -1, bool owning = true) noexcept;
  [[nodiscard]] auto valid() const noexcept -> bool;

  // New owning descriptor referring to the same open file.
  [[nodiscard]] auto try_clone() const -> syscall::Result<FileDescriptor>;
};

struct PipePair {
  FileDescriptor read_;
  FileDescriptor write_;
};

auto make_pipe() -> syscall::Result<PipePair>;

} // namespace duct::core
