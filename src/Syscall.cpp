#include "duct/Syscall.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace duct::core::syscall {

auto wait_for_process(pid_t pid) -> Result<WaitInfo> {
  int   status     = 0;
  pid_t result_pid = -1;
  do {
    result_pid = waitpid(pid, &status, 0);
  } while (result_pid == -1 && errno == EINTR);

  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  return WaitInfo{result_pid, status};
}

auto spawn_process(
    char const*                       program,
    char* const*                      argv,
    char* const*                      envp,
    posix_spawn_file_actions_t const* file_actions,
    posix_spawnattr_t const*          attr
) -> Result<pid_t> {
  pid_t pid = 0;
  if (int result = posix_spawnp(&pid, program, file_actions, attr, argv, envp)) {
    return std::unexpected(result);
  }
  return pid;
}

auto close_fd(int fd) -> Result<void> {
  if (close(fd) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto create_pipe() -> Result<std::array<int, 2>> {
  std::array<int, 2> fds{-1, -1};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return fds;
}

auto write_fd(int fd, std::string_view data) -> Result<size_t> {
  ssize_t result = -1;
  do {
    result = write(fd, data.data(), data.size());
  } while (result == -1 && errno == EINTR);

  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = -1;
  do {
    result = read(fd, buffer, size);
  } while (result == -1 && errno == EINTR);

  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto get_current_directory() -> Result<std::string> {
  std::string buffer(4096, '\0');
  if (getcwd(buffer.data(), buffer.size()) == nullptr) {
    return std::unexpected(errno);
  }

  // Resize to actual length
  buffer.resize(std::strlen(buffer.c_str()));
  return buffer;
}

auto open_file(std::string const& path, int flags, mode_t mode) -> Result<int> {
  int fd = -1;
  do {
    fd = open(path.c_str(), flags | O_CLOEXEC, mode);
  } while (fd == -1 && errno == EINTR);

  if (fd == -1) {
    return std::unexpected(errno);
  }
  return fd;
}

auto duplicate_fd(int fd) -> Result<int> {
  int new_fd = fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (new_fd == -1) {
    return std::unexpected(errno);
  }
  return new_fd;
}

auto set_close_on_exec(int fd) -> Result<void> {
  int flags = fcntl(fd, F_GETFD);
  if (flags == -1) {
    return std::unexpected(errno);
  }
  if (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

} // namespace duct::core::syscall
