#include "duct/Forwarding.hpp"
#include "duct/Constants.hpp"
#include "duct/Log.hpp"
#include "duct/Signals.hpp"
#include "duct/Syscall.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace duct::detail {

namespace {

Result<void> write_all(int fd, std::string_view bytes) {
  while (!bytes.empty()) {
    auto written = core::syscall::write_fd(fd, bytes.substr(0, std::min(bytes.size(), WRITE_CHUNK_SIZE)));
    if (!written) {
      return std::unexpected(Error::io("failed to write child stdin", written.error()));
    }
    bytes.remove_prefix(*written);
  }
  return {};
}

Result<void> read_all(int fd, std::string& buffer, Stream stream) {
  std::array<char, READ_CHUNK_SIZE> chunk{};
  while (true) {
    auto count = core::syscall::read_fd(fd, chunk.data(), chunk.size());
    if (!count) {
      return std::unexpected(Error::io(fmt::format("failed to read captured {}", to_string(stream)), count.error()));
    }
    if (*count == 0) {
      return {};
    }
    buffer.append(chunk.data(), *count);
  }
}

} // namespace

Result<void> suppress_broken_pipe(Result<void> result) {
  if (!result && result.error().kind() == ErrorKind::IoFailure && result.error().error_code() == EPIPE) {
    return {};
  }
  return result;
}

ForwardingThread::ForwardingThread(std::shared_ptr<State> state, std::thread thread) noexcept
    : state_(std::move(state)), thread_(std::move(thread)) {}

ForwardingThread::~ForwardingThread() {
  if (thread_.joinable()) {
    thread_.detach();
  }
}

ForwardingThread::ForwardingThread(ForwardingThread&&) noexcept = default;

ForwardingThread& ForwardingThread::operator=(ForwardingThread&& other) noexcept {
  if (this != &other) {
    if (thread_.joinable()) {
      thread_.detach();
    }
    state_  = std::move(other.state_);
    thread_ = std::move(other.thread_);
  }
  return *this;
}

Result<ForwardingThread>
ForwardingThread::writer(core::FileDescriptor write_end, std::shared_ptr<std::string const> bytes) {
  auto state = std::make_shared<State>();
  auto size  = bytes->size();
  auto body  = [state, bytes = std::move(bytes), fd = std::move(write_end)]() mutable {
    if (int err = blockSigpipeOnThisThread()) {
      log::warn("failed to block SIGPIPE on input thread: {}", std::strerror(err));
    }
    auto result = suppress_broken_pipe(write_all(fd.get(), *bytes));
    clearPendingSigpipe();
    fd.reset();
    if (!result) {
      state->error_ = std::move(result.error());
    }
  };

  try {
    std::thread thread{std::move(body)};
    log::debug("started input thread for {} bytes", size);
    return ForwardingThread{std::move(state), std::move(thread)};
  } catch (std::system_error const& e) {
    return std::unexpected(Error::io("failed to start input thread", e.code().value()));
  }
}

Result<ForwardingThread> ForwardingThread::reader(core::FileDescriptor read_end, Stream stream) {
  auto state = std::make_shared<State>();
  auto body  = [state, stream, fd = std::move(read_end)]() mutable {
    auto result = read_all(fd.get(), state->buffer_, stream);
    fd.reset();
    if (!result) {
      state->error_ = std::move(result.error());
    }
  };

  try {
    std::thread thread{std::move(body)};
    log::debug("started {} capture thread", to_string(stream));
    return ForwardingThread{std::move(state), std::move(thread)};
  } catch (std::system_error const& e) {
    return std::unexpected(Error::io(fmt::format("failed to start {} capture thread", to_string(stream)), e.code().value()));
  }
}

Result<std::string> ForwardingThread::join() {
  if (!thread_.joinable() || !state_) {
    return std::unexpected(Error::io("join on a forwarding thread that is not running", EINVAL));
  }
  thread_.join();

  auto state = std::move(state_);
  if (state->error_) {
    return std::unexpected(std::move(*state->error_));
  }
  return std::move(state->buffer_);
}

CaptureSink::CaptureSink(Stream stream) noexcept
    : stream_(stream) {}

Result<IoValue> CaptureSink::connect() {
  std::lock_guard lock(mutex_);
  if (!write_end_.valid()) {
    auto pipe = core::make_pipe();
    if (!pipe) {
      return std::unexpected(Error::io(fmt::format("failed to create {} capture pipe", to_string(stream_)), pipe.error()));
    }
    auto reader = ForwardingThread::reader(std::move(pipe->read_), stream_);
    if (!reader) {
      return std::unexpected(std::move(reader.error()));
    }
    reader_.emplace(std::move(*reader));
    write_end_ = std::move(pipe->write_);
  }

  auto cloned = write_end_.try_clone();
  if (!cloned) {
    return std::unexpected(Error::io(fmt::format("failed to duplicate {} capture pipe", to_string(stream_)), cloned.error()));
  }
  return IoValue::pipe_end(std::move(*cloned));
}

Result<std::string> CaptureSink::finish() {
  std::optional<ForwardingThread> reader;
  {
    std::lock_guard lock(mutex_);
    write_end_.reset();
    reader.swap(reader_);
  }
  if (!reader) {
    return std::string{};
  }
  return reader->join();
}

} // namespace duct::detail
