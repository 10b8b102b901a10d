#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include <sys/types.h>

#include "duct/Environment.hpp"
#include "duct/Error.hpp"
#include "duct/Output.hpp"

namespace duct {

// Descriptors a child gets as fd 0, 1 and 2. The caller keeps ownership.
struct Stdio {
  int stdin_  = 0;
  int stdout_ = 1;
  int stderr_ = 2;
};

class Child {
  pid_t       pid_ = -1;
  std::string program_;

  Child(pid_t pid, std::string program) noexcept;

public:
  Child() = default;

  // Non-blocking destructor: an un-waited child is reaped by a detached
  // background thread so it does not linger as a zombie.
  ~Child();

  Child(Child const&)            = delete;
  Child& operator=(Child const&) = delete;
  Child(Child&& other) noexcept;
  Child& operator=(Child&& other) noexcept;

  // `dir` is applied in the child before exec, so a relative program path with a
  // slash is resolved against it.
  [[nodiscard]] static Result<Child> spawn(
      std::span<std::string const>                argv,
      EnvMap const&                               env,
      std::optional<std::filesystem::path> const& dir,
      Stdio                                       stdio
  );

  [[nodiscard]] Result<ExitStatus> wait();

  [[nodiscard]] pid_t pid() const noexcept {
    return pid_;
  }

  [[nodiscard]] std::string const& program() const noexcept {
    return program_;
  }

private:
  void abandon() noexcept;
};

// Waits for `pid` on a detached thread.
void reapInBackground(pid_t pid) noexcept;

} // namespace duct
