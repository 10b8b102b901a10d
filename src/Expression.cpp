#include "duct/Expression.hpp"
#include "duct/Constants.hpp"
#include "duct/Engine.hpp"
#include "duct/Handle.hpp"
#include "duct/Log.hpp"
#include "duct/Node.hpp"
#include "duct/Syscall.hpp"
#include "duct/Util.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace duct {

namespace {

template<typename T>
Expression make_expression(T node) {
  return Expression{std::make_shared<detail::Node const>(detail::Node{std::move(node)})};
}

Expression redirect(Expression const& inner, Stream stream, detail::Redirect target) {
  return make_expression(detail::IoNode{stream, std::move(target), inner});
}

// The descriptor may live as long as the expression; only the child it is
// dup2'ed into should inherit it.
std::shared_ptr<core::FileDescriptor const> share(core::FileDescriptor fd) {
  if (fd.valid()) {
    if (auto cloexec = core::syscall::set_close_on_exec(fd.get()); !cloexec) {
      log::warn("failed to set close-on-exec on descriptor {}: {}", fd.get(), std::strerror(cloexec.error()));
    }
  }
  return std::make_shared<core::FileDescriptor const>(std::move(fd));
}

std::string describe_redirect(Stream stream, detail::Redirect const& target) {
  return std::visit(
      util::Overloaded{
          [](detail::Redirect::Null const&) { return std::string{"null"}; },
          [](detail::Redirect::Path const& p) { return fmt::format("path {}", util::quote(p.path_.string())); },
          [](detail::Redirect::OwnedFd const& f) { return fmt::format("file {}", f.fd_->get()); },
          [](detail::Redirect::BorrowedFd const& f) { return fmt::format("handle {}", f.fd_); },
          [](detail::Redirect::Bytes const& b) { return fmt::format("input {} bytes", b.bytes_->size()); },
          [](detail::Redirect::Capture const&) { return std::string{"capture"}; },
          [&](detail::Redirect::Swap const&) {
            return std::string{stream == Stream::Stdout ? "to stderr" : "to stdout"};
          },
      },
      target.value_
  );
}

std::string describe_env(EnvMap const& vars) {
  std::vector<std::string> entries;
  entries.reserve(vars.size());
  for (auto const& [name, value] : vars) {
    entries.push_back(fmt::format("{}={}", name, util::quote(value)));
  }
  return fmt::format("{}", fmt::join(entries, ", "));
}

} // namespace

Expression::Expression(std::shared_ptr<detail::Node const> node) noexcept
    : node_(std::move(node)) {}

detail::Node const& Expression::node() const noexcept {
  return *node_;
}

Expression Expression::pipe(Expression const& right) const {
  return make_expression(detail::PipeNode{*this, right});
}

Expression Expression::then(Expression const& right) const {
  return make_expression(detail::ThenNode{*this, right});
}

Expression Expression::input(std::string bytes) const {
  auto shared = std::make_shared<std::string const>(std::move(bytes));
  return redirect(*this, Stream::Stdin, {detail::Redirect::Bytes{std::move(shared)}});
}

Expression Expression::input(std::vector<std::uint8_t> const& bytes) const {
  return input(std::string(bytes.begin(), bytes.end()));
}

Expression Expression::stdin_path(std::filesystem::path path) const {
  return redirect(*this, Stream::Stdin, {detail::Redirect::Path{std::move(path)}});
}

Expression Expression::stdin_file(core::FileDescriptor fd) const {
  return redirect(*this, Stream::Stdin, {detail::Redirect::OwnedFd{share(std::move(fd))}});
}

Expression Expression::stdin_handle(int fd) const {
  return redirect(*this, Stream::Stdin, {detail::Redirect::BorrowedFd{fd}});
}

Expression Expression::stdin_null() const {
  return redirect(*this, Stream::Stdin, {detail::Redirect::Null{}});
}

Expression Expression::stdout_path(std::filesystem::path path) const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::Path{std::move(path)}});
}

Expression Expression::stdout_file(core::FileDescriptor fd) const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::OwnedFd{share(std::move(fd))}});
}

Expression Expression::stdout_handle(int fd) const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::BorrowedFd{fd}});
}

Expression Expression::stdout_null() const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::Null{}});
}

Expression Expression::stdout_capture() const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::Capture{}});
}

Expression Expression::stdout_to_stderr() const {
  return redirect(*this, Stream::Stdout, {detail::Redirect::Swap{}});
}

Expression Expression::stderr_path(std::filesystem::path path) const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::Path{std::move(path)}});
}

Expression Expression::stderr_file(core::FileDescriptor fd) const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::OwnedFd{share(std::move(fd))}});
}

Expression Expression::stderr_handle(int fd) const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::BorrowedFd{fd}});
}

Expression Expression::stderr_null() const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::Null{}});
}

Expression Expression::stderr_capture() const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::Capture{}});
}

Expression Expression::stderr_to_stdout() const {
  return redirect(*this, Stream::Stderr, {detail::Redirect::Swap{}});
}

Expression Expression::env(std::string_view name, std::string_view value) const {
  return make_expression(detail::EnvNode{EnvMap{{std::string{name}, std::string{value}}}, *this});
}

Expression Expression::full_env(EnvMap vars) const {
  return make_expression(detail::FullEnvNode{std::move(vars), *this});
}

Expression Expression::dir(std::filesystem::path path) const {
  return make_expression(detail::DirNode{std::move(path), *this});
}

Expression Expression::unchecked() const {
  return make_expression(detail::UncheckedNode{*this});
}

Result<Handle> Expression::start() const {
  auto execution = detail::Execution::start(*this);
  if (!execution) {
    return std::unexpected(std::move(execution.error()));
  }
  return Handle{std::move(*execution)};
}

Result<Output> Expression::run() const {
  auto handle = start();
  if (!handle) {
    return std::unexpected(std::move(handle.error()));
  }
  return handle->wait();
}

Result<std::string> Expression::read() const {
  auto output = stdout_capture().run();
  if (!output) {
    return std::unexpected(std::move(output.error()));
  }

  std::string text = std::move(output->stdout_);
  if (!util::is_valid_utf8(text)) {
    return std::unexpected(Error::invalid_utf8("captured stdout is not valid UTF-8"));
  }
  util::strip_trailing_newline(text);
  return text;
}

std::string Expression::to_string() const {
  return std::visit(
      util::Overloaded{
          [](detail::CmdNode const& c) {
            std::vector<std::string> quoted;
            quoted.reserve(c.argv_.size());
            for (auto const& arg : c.argv_) {
              quoted.push_back(util::quote(arg));
            }
            if (c.env_.empty()) {
              return fmt::format("Cmd[{}]", fmt::join(quoted, ", "));
            }
            return fmt::format("Cmd[{}]{{{}}}", fmt::join(quoted, ", "), describe_env(c.env_));
          },
          [](detail::PipeNode const& p) {
            return fmt::format("Pipe({}, {})", p.left_.to_string(), p.right_.to_string());
          },
          [](detail::ThenNode const& t) {
            return fmt::format("Then({}, {})", t.left_.to_string(), t.right_.to_string());
          },
          [](detail::IoNode const& io) {
            return fmt::format(
                "Io({} {}, {})",
                duct::to_string(io.stream_),
                describe_redirect(io.stream_, io.target_),
                io.inner_.to_string()
            );
          },
          [](detail::EnvNode const& e) {
            return fmt::format("Env({}, {})", describe_env(e.vars_), e.inner_.to_string());
          },
          [](detail::FullEnvNode const& e) {
            return fmt::format("FullEnv({}, {})", describe_env(e.vars_), e.inner_.to_string());
          },
          [](detail::DirNode const& d) {
            return fmt::format("Dir({}, {})", util::quote(d.path_.string()), d.inner_.to_string());
          },
          [](detail::UncheckedNode const& u) { return fmt::format("Unchecked({})", u.inner_.to_string()); },
      },
      node_->value_
  );
}

Expression cmd(std::vector<std::string> argv, EnvMap env) {
  return make_expression(detail::CmdNode{std::move(argv), std::move(env)});
}

Expression sh(std::string_view command) {
  return cmd(std::vector<std::string>{std::string{SHELL_PATH}, std::string{SHELL_FLAG}, std::string{command}});
}

namespace detail {

std::string sanitize_program(std::filesystem::path const& program) {
  if (program.is_relative() && !program.has_parent_path() && !program.empty()) {
    return (std::filesystem::path{"."} / program).string();
  }
  return program.string();
}

} // namespace detail

} // namespace duct
