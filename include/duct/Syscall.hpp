#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include <spawn.h>
#include <sys/types.h>

namespace duct::core::syscall {

template<typename T>
using Result = std::expected<T, int>;

struct WaitInfo {
  pid_t pid_;
  int   status_;
};

auto wait_for_process(pid_t pid) -> Result<WaitInfo>;
auto spawn_process(
    char const*                       program,
    char* const*                      argv,
    char* const*                      envp,
    posix_spawn_file_actions_t const* file_actions,
    posix_spawnattr_t const*          attr
) -> Result<pid_t>;

auto close_fd(int fd) -> Result<void>;
auto create_pipe() -> Result<std::array<int, 2>>;
auto write_fd(int fd, std::string_view data) -> Result<size_t>;
auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t>;
auto get_current_directory() -> Result<std::string>;
auto open_file(std::string const& path, int flags, mode_t mode = 0) -> Result<int>;
auto duplicate_fd(int fd) -> Result<int>;
auto set_close_on_exec(int fd) -> Result<void>;

} // namespace duct::core::syscall
