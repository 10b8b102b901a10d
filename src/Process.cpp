#include "duct/Process.hpp"
#include "duct/Environment.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/Log.hpp"
#include "duct/Signals.hpp"
#include "duct/Syscall.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spawn.h>
#include <unistd.h>

namespace duct {

namespace {

std::vector<char*> create_argv(std::span<std::string const> args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto const& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

// Owns the posix_spawn attribute objects for the duration of one spawn.
class SpawnAttributes {
  posix_spawn_file_actions_t file_actions_{};
  posix_spawnattr_t          attrs_{};
  bool                       actions_init_ = false;
  bool                       attrs_init_   = false;

public:
  SpawnAttributes() = default;
  ~SpawnAttributes() {
    if (attrs_init_) {
      posix_spawnattr_destroy(&attrs_);
    }
    if (actions_init_) {
      posix_spawn_file_actions_destroy(&file_actions_);
    }
  }

  SpawnAttributes(SpawnAttributes const&)            = delete;
  SpawnAttributes& operator=(SpawnAttributes const&) = delete;
  SpawnAttributes(SpawnAttributes&&)                 = delete;
  SpawnAttributes& operator=(SpawnAttributes&&)      = delete;

  int init() {
    if (int err = posix_spawn_file_actions_init(&file_actions_)) {
      return err;
    }
    actions_init_ = true;
    if (int err = posix_spawnattr_init(&attrs_)) {
      return err;
    }
    attrs_init_ = true;
    return 0;
  }

  posix_spawn_file_actions_t* file_actions() noexcept {
    return &file_actions_;
  }
  posix_spawnattr_t* attrs() noexcept {
    return &attrs_;
  }
};

} // namespace

Child::Child(pid_t pid, std::string program) noexcept
    : pid_(pid), program_(std::move(program)) {}

Child::~Child() {
  abandon();
}

Child::Child(Child&& other) noexcept
    : pid_(other.pid_), program_(std::move(other.program_)) {
  other.pid_ = -1;
}

Child& Child::operator=(Child&& other) noexcept {
  if (this != &other) {
    abandon();
    pid_       = other.pid_;
    program_   = std::move(other.program_);
    other.pid_ = -1;
  }
  return *this;
}

Result<Child> Child::spawn(
    std::span<std::string const>                argv,
    EnvMap const&                               env,
    std::optional<std::filesystem::path> const& dir,
    Stdio                                       stdio
) {
  if (argv.empty() || argv.front().empty()) {
    return std::unexpected(Error::spawn("failed to spawn child", EINVAL));
  }

  std::string const& program = argv.front();
  auto               failed  = [&](std::string_view step, int err) {
    return std::unexpected(Error::spawn(fmt::format("failed to spawn {} ({})", program, step), err));
  };

  // dup2 onto 0, 1 and 2 happens in order, so a source descriptor below 3 could
  // be overwritten before it is used. Move those out of the way first.
  std::array<int, 3>                  sources{stdio.stdin_, stdio.stdout_, stdio.stderr_};
  std::array<core::FileDescriptor, 3> relocated;
  for (int target = 0; target < 3; ++target) {
    int& source = sources[target];
    if (source >= 0 && source < 3 && source != target) {
      auto dup_result = core::syscall::duplicate_fd(source);
      if (!dup_result) {
        return failed("dup", dup_result.error());
      }
      relocated[target].reset(*dup_result);
      source = *dup_result;
    }
  }

  SpawnAttributes spawn_attrs;
  if (int err = spawn_attrs.init()) {
    return failed("posix_spawn init", err);
  }

  for (int target = 0; target < 3; ++target) {
    if (int err = posix_spawn_file_actions_adddup2(spawn_attrs.file_actions(), sources[target], target)) {
      return failed("adddup2", err);
    }
  }

  if (dir.has_value()) {
    if (int err = posix_spawn_file_actions_addchdir_np(spawn_attrs.file_actions(), dir->c_str())) {
      return failed("addchdir", err);
    }
  }

  if (int err = setChildSignals(spawn_attrs.attrs())) {
    return failed("signal attributes", err);
  }

  auto           args = create_argv(argv);
  core::EnvBlock env_block{env};

  auto pid = core::syscall::spawn_process(
      program.c_str(), args.data(), env_block.data(), spawn_attrs.file_actions(), spawn_attrs.attrs()
  );
  if (!pid) {
    return failed("exec", pid.error());
  }

  log::debug("spawned {} as pid {}", program, *pid);
  return Child{*pid, program};
}

Result<ExitStatus> Child::wait() {
  if (pid_ == -1) {
    return std::unexpected(Error::io("wait on a child that is not running", ECHILD));
  }

  auto info = core::syscall::wait_for_process(pid_);
  pid_      = -1;
  if (!info) {
    return std::unexpected(Error::io(fmt::format("failed to wait for {}", program_), info.error()));
  }

  auto status = ExitStatus::from_wait_status(info->status_);
  log::debug("{} (pid {}) finished with {}", program_, info->pid_, status.to_string());
  return status;
}

void Child::abandon() noexcept {
  if (pid_ != -1) {
    reapInBackground(pid_);
    pid_ = -1;
  }
}

void reapInBackground(pid_t pid) noexcept {
  try {
    std::thread([pid] {
      if (auto info = core::syscall::wait_for_process(pid); !info) {
        log::warn("failed to reap pid {}: {}", pid, std::strerror(info.error()));
      }
    }).detach();
  } catch (std::system_error const& e) {
    log::warn("failed to start reaper for pid {}: {}", pid, e.what());
  }
}

} // namespace duct
