#include "duct/Output.hpp"
#include "duct/Constants.hpp"

#include <string>

#include <fmt/core.h>
#include <sys/wait.h>

namespace duct {

ExitStatus ExitStatus::from_wait_status(int wait_status) noexcept {
  if (WIFSIGNALED(wait_status)) {
    return killed(WTERMSIG(wait_status));
  }
  if (WIFEXITED(wait_status)) {
    return exited(WEXITSTATUS(wait_status));
  }
  // Stopped or continued children are not reported by a blocking waitpid(pid, .., 0)
  return exited(wait_status);
}

int ExitStatus::shell_code() const noexcept {
  return signaled_ ? SIGNAL_EXIT_CODE_OFFSET + value_ : value_;
}

std::string ExitStatus::to_string() const {
  if (signaled_) {
    return fmt::format("signal: {}", value_);
  }
  return fmt::format("exit status: {}", value_);
}

} // namespace duct
