#pragma once

#include <optional>
#include <string>

namespace duct {

// Exit status of one child process: a normal exit code or a terminating signal.
class ExitStatus {
  int  value_    = 0;
  bool signaled_ = false;

public:
  constexpr ExitStatus() noexcept = default;

  [[nodiscard]] static constexpr ExitStatus exited(int code) noexcept {
    ExitStatus status;
    status.value_ = code;
    return status;
  }

  [[nodiscard]] static constexpr ExitStatus killed(int signal) noexcept {
    ExitStatus status;
    status.value_    = signal;
    status.signaled_ = true;
    return status;
  }

  // Decodes a waitpid() status word.
  [[nodiscard]] static ExitStatus from_wait_status(int wait_status) noexcept;

  [[nodiscard]] constexpr bool success() const noexcept {
    return !signaled_ && value_ == 0;
  }

  [[nodiscard]] constexpr std::optional<int> code() const noexcept {
    return signaled_ ? std::nullopt : std::optional<int>{value_};
  }

  [[nodiscard]] constexpr std::optional<int> signal() const noexcept {
    return signaled_ ? std::optional<int>{value_} : std::nullopt;
  }

  // Shell convention: exit code, or 128 + signal number.
  [[nodiscard]] int shell_code() const noexcept;

  [[nodiscard]] std::string to_string() const;

  constexpr bool operator==(ExitStatus const&) const noexcept = default;
};

struct Output {
  ExitStatus  status_;
  std::string stdout_;
  std::string stderr_;
};

} // namespace duct
