#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "duct/Environment.hpp"
#include "duct/Error.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/Output.hpp"

namespace duct {

class Handle;

namespace detail {
struct Node;
} // namespace detail

// Immutable description of a process pipeline. Every builder returns a new
// Expression wrapping the receiver; subtrees are shared, so copies are cheap and
// one Expression can be started any number of times.
class Expression {
  std::shared_ptr<detail::Node const> node_;

public:
  explicit Expression(std::shared_ptr<detail::Node const> node) noexcept;

  [[nodiscard]] Expression pipe(Expression const& right) const;
  [[nodiscard]] Expression then(Expression const& right) const;

  [[nodiscard]] Expression input(std::string bytes) const;
  [[nodiscard]] Expression input(std::vector<std::uint8_t> const& bytes) const;
  [[nodiscard]] Expression stdin_path(std::filesystem::path path) const;
  [[nodiscard]] Expression stdin_file(core::FileDescriptor fd) const;
  [[nodiscard]] Expression stdin_handle(int fd) const;
  [[nodiscard]] Expression stdin_null() const;

  [[nodiscard]] Expression stdout_path(std::filesystem::path path) const;
  [[nodiscard]] Expression stdout_file(core::FileDescriptor fd) const;
  [[nodiscard]] Expression stdout_handle(int fd) const;
  [[nodiscard]] Expression stdout_null() const;
  [[nodiscard]] Expression stdout_capture() const;
  [[nodiscard]] Expression stdout_to_stderr() const;

  [[nodiscard]] Expression stderr_path(std::filesystem::path path) const;
  [[nodiscard]] Expression stderr_file(core::FileDescriptor fd) const;
  [[nodiscard]] Expression stderr_handle(int fd) const;
  [[nodiscard]] Expression stderr_null() const;
  [[nodiscard]] Expression stderr_capture() const;
  [[nodiscard]] Expression stderr_to_stdout() const;

  [[nodiscard]] Expression env(std::string_view name, std::string_view value) const;
  [[nodiscard]] Expression full_env(EnvMap vars) const;
  [[nodiscard]] Expression dir(std::filesystem::path path) const;
  [[nodiscard]] Expression unchecked() const;

  // Spawns every process the expression needs right away and returns without
  // waiting for any of them.
  [[nodiscard]] Result<Handle> start() const;

  [[nodiscard]] Result<Output> run() const;

  // Captured stdout as text, with one trailing "\n" or "\r\n" removed.
  [[nodiscard]] Result<std::string> read() const;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] detail::Node const& node() const noexcept;
};

[[nodiscard]] Expression cmd(std::vector<std::string> argv, EnvMap env = {});

// Runs `command` with the platform shell.
[[nodiscard]] Expression sh(std::string_view command);

namespace detail {

// "name" is looked up in PATH; path("name") means ./name.
[[nodiscard]] std::string sanitize_program(std::filesystem::path const& program);

template<typename T>
std::string program_string(T const& program) {
  if constexpr (std::is_same_v<T, std::filesystem::path>) {
    return sanitize_program(program);
  } else {
    return std::string{std::string_view{program}};
  }
}

template<typename T>
std::string argument_string(T const& argument) {
  if constexpr (std::is_same_v<T, std::filesystem::path>) {
    return argument.string();
  } else {
    return std::string{std::string_view{argument}};
  }
}

} // namespace detail

template<typename Program, typename... Args>
[[nodiscard]] Expression cmd(Program const& program, Args const&... args) {
  std::vector<std::string> argv;
  argv.reserve(sizeof...(Args) + 1);
  argv.push_back(detail::program_string(program));
  (argv.push_back(detail::argument_string(args)), ...);
  return cmd(std::move(argv));
}

} // namespace duct
