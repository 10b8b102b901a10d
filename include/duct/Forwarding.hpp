#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "duct/Error.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/IoValue.hpp"

namespace duct::detail {

// A failed write into a child's stdin because the child stopped reading is not
// an error: the writer cannot tell that apart from "the child is done".
[[nodiscard]] Result<void> suppress_broken_pipe(Result<void> result);

// One thread feeding bytes into, or draining bytes out of, a pipe. The thread
// owns its descriptor and shared state, so an un-joined ForwardingThread can be
// detached safely.
class ForwardingThread {
  struct State {
    std::string          buffer_;
    std::optional<Error> error_;
  };

  std::shared_ptr<State> state_;
  std::thread            thread_;

  ForwardingThread(std::shared_ptr<State> state, std::thread thread) noexcept;

public:
  ForwardingThread()  = default;
  ~ForwardingThread();

  ForwardingThread(ForwardingThread const&)            = delete;
  ForwardingThread& operator=(ForwardingThread const&) = delete;
  ForwardingThread(ForwardingThread&&) noexcept;
  ForwardingThread& operator=(ForwardingThread&&) noexcept;

  // Writes `bytes` to `write_end`, then closes it.
  [[nodiscard]] static Result<ForwardingThread>
  writer(core::FileDescriptor write_end, std::shared_ptr<std::string const> bytes);

  // Reads `read_end` to EOF into a buffer.
  [[nodiscard]] static Result<ForwardingThread> reader(core::FileDescriptor read_end, Stream stream);

  // Waits for the thread; returns what a reader collected (empty for a writer).
  [[nodiscard]] Result<std::string> join();

  [[nodiscard]] bool joinable() const noexcept {
    return thread_.joinable();
  }
};

// Destination shared by every *_capture() of one stream in an evaluation. The
// pipe and its reader thread are created on first use. connect() may be called
// from the thread sequencing a `then`.
class CaptureSink {
  std::mutex                      mutex_;
  Stream                          stream_;
  core::FileDescriptor            write_end_;
  std::optional<ForwardingThread> reader_;

public:
  explicit CaptureSink(Stream stream) noexcept;

  // A new write end for a child.
  [[nodiscard]] Result<IoValue> connect();

  // Closes the parent's write end and collects everything captured. Call after
  // every child that may hold a write end has exited.
  [[nodiscard]] Result<std::string> finish();
};

} // namespace duct::detail
