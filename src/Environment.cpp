#include "duct/Environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>

extern "C" {
  extern char** environ; // NOLINT
}

namespace duct::core {

namespace {

std::mutex& environment_mutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace

auto environment_snapshot() -> EnvMap {
  std::lock_guard lock(environment_mutex());

  EnvMap result;
  if (::environ == nullptr) {
    return result;
  }
  for (char** env = ::environ; *env != nullptr; ++env) {
    std::string_view entry{*env};
    if (auto pos = entry.find('='); pos != std::string_view::npos && pos > 0) {
      result.insert_or_assign(std::string{entry.substr(0, pos)}, std::string{entry.substr(pos + 1)});
    }
  }
  return result;
}

auto set_variable(std::string const& name, std::string const& value) -> syscall::Result<void> {
  std::lock_guard lock(environment_mutex());
  if (setenv(name.c_str(), value.c_str(), 1) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto unset_variable(std::string const& name) -> syscall::Result<void> {
  std::lock_guard lock(environment_mutex());
  if (unsetenv(name.c_str()) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

EnvBlock::EnvBlock(EnvMap const& env) {
  entries_.reserve(env.size());
  for (auto const& [name, value] : env) {
    std::string entry;
    entry.reserve(name.size() + value.size() + 1);
    entry.append(name).append(1, '=').append(value);
    entries_.push_back(std::move(entry));
  }

  // entries_ is not resized after this point, so the pointers stay valid
  pointers_.reserve(entries_.size() + 1);
  for (auto& entry : entries_) {
    pointers_.push_back(entry.data());
  }
  pointers_.push_back(nullptr);
}

} // namespace duct::core
