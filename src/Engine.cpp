#include "duct/Engine.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/Forwarding.hpp"
#include "duct/Log.hpp"
#include "duct/Node.hpp"
#include "duct/Process.hpp"
#include "duct/Resolver.hpp"
#include "duct/Syscall.hpp"
#include "duct/Util.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <unistd.h>

namespace duct::detail {

namespace {

class ChildRunning final : public Running {
  Child child_;

public:
  explicit ChildRunning(Child child) noexcept
      : child_(std::move(child)) {}

  Result<Outcome> wait() override {
    auto status = child_.wait();
    if (!status) {
      return std::unexpected(std::move(status.error()));
    }
    return Outcome{*status, true};
  }
};

class PipeRunning final : public Running {
  RunningPtr left_;
  RunningPtr right_;

public:
  PipeRunning(RunningPtr left, RunningPtr right) noexcept
      : left_(std::move(left)), right_(std::move(right)) {}

  // Both sides are waited even if the left one failed; the first error in
  // left-to-right order is the one reported.
  Result<Outcome> wait() override {
    auto left  = left_->wait();
    auto right = right_->wait();
    if (!left) {
      return left;
    }
    if (!right) {
      return right;
    }
    auto outcome = resolve_pipe(*left, *right);
    log::debug("pipe resolved to {} (checked: {})", outcome.status_.to_string(), outcome.checked_);
    return outcome;
  }
};

Result<Outcome> run_sequence(RunningPtr left, Expression const& right, Context context) {
  auto left_outcome = left->wait();
  if (!left_outcome) {
    return left_outcome;
  }
  if (!then_continues(*left_outcome)) {
    log::debug("then stopped after {}", left_outcome->status_.to_string());
    return left_outcome;
  }

  auto started = start(right, std::move(context));
  if (!started) {
    return std::unexpected(std::move(started.error()));
  }
  auto right_outcome = (*started)->wait();
  if (!right_outcome) {
    return right_outcome;
  }
  return resolve_then(*left_outcome, *right_outcome);
}

// The right side of a `then` must not start before the left side has exited,
// but start() must not block on it either. A sequencing thread waits for the
// left side and starts the right side as soon as it is allowed to run, so a
// `then` inside a `pipe` keeps its pipe drained.
class ThenRunning final : public Running {
  struct State {
    std::optional<Result<Outcome>> result_;
  };

  struct Token {};

  std::shared_ptr<State> state_;
  std::thread            thread_;

public:
  ThenRunning(Token, std::shared_ptr<State> state, std::thread thread) noexcept
      : state_(std::move(state)), thread_(std::move(thread)) {}

  ~ThenRunning() override {
    if (thread_.joinable()) {
      thread_.detach();
    }
  }

  ThenRunning(ThenRunning const&)            = delete;
  ThenRunning& operator=(ThenRunning const&) = delete;
  ThenRunning(ThenRunning&&)                 = delete;
  ThenRunning& operator=(ThenRunning&&)      = delete;

  static Result<RunningPtr> start(RunningPtr left, Expression right, Context context) {
    auto state = std::make_shared<State>();
    // Ownership moves into the thread. If the thread cannot be created, the
    // callable is destroyed and so are the left side and the pending context.
    auto body = [state, left = std::move(left), right = std::move(right), context = std::move(context)]() mutable {
      state->result_.emplace(run_sequence(std::move(left), right, std::move(context)));
    };

    try {
      std::thread thread{std::move(body)};
      return RunningPtr{std::make_unique<ThenRunning>(Token{}, std::move(state), std::move(thread))};
    } catch (std::system_error const& e) {
      return std::unexpected(Error::io("failed to start then thread", e.code().value()));
    }
  }

  Result<Outcome> wait() override {
    if (!thread_.joinable()) {
      return std::unexpected(Error::io("wait on a then that is not running", EINVAL));
    }
    thread_.join();
    return std::move(*state_->result_);
  }
};

class InputRunning final : public Running {
  RunningPtr       inner_;
  ForwardingThread writer_;

public:
  InputRunning(RunningPtr inner, ForwardingThread writer) noexcept
      : inner_(std::move(inner)), writer_(std::move(writer)) {}

  Result<Outcome> wait() override {
    auto outcome = inner_->wait();
    auto written = writer_.join();
    if (!outcome) {
      return outcome;
    }
    if (!written) {
      return std::unexpected(std::move(written.error()));
    }
    return outcome;
  }
};

class UncheckedRunning final : public Running {
  RunningPtr inner_;

public:
  explicit UncheckedRunning(RunningPtr inner) noexcept
      : inner_(std::move(inner)) {}

  Result<Outcome> wait() override {
    auto outcome = inner_->wait();
    if (!outcome) {
      return outcome;
    }
    return resolve_unchecked(*outcome);
  }
};

Result<RunningPtr> start_cmd(CmdNode const& node, Context context) {
  auto stdin_fd = context.stdin_.open_for(Stream::Stdin, context.dir_);
  if (!stdin_fd) {
    return std::unexpected(std::move(stdin_fd.error()));
  }
  auto stdout_fd = context.stdout_.open_for(Stream::Stdout, context.dir_);
  if (!stdout_fd) {
    return std::unexpected(std::move(stdout_fd.error()));
  }
  auto stderr_fd = context.stderr_.open_for(Stream::Stderr, context.dir_);
  if (!stderr_fd) {
    return std::unexpected(std::move(stderr_fd.error()));
  }

  EnvMap env = std::move(context.env_);
  for (auto const& [name, value] : node.env_) {
    env.insert_or_assign(name, value);
  }

  auto child = Child::spawn(node.argv_, env, context.dir_, Stdio{stdin_fd->get(), stdout_fd->get(), stderr_fd->get()});
  if (!child) {
    return std::unexpected(std::move(child.error()));
  }
  return RunningPtr{std::make_unique<ChildRunning>(std::move(*child))};
}

Result<RunningPtr> start_pipe(PipeNode const& node, Context context) {
  auto pipe = core::make_pipe();
  if (!pipe) {
    return std::unexpected(Error::io("failed to create pipe", pipe.error()));
  }

  auto left_context = context.try_clone();
  if (!left_context) {
    return std::unexpected(std::move(left_context.error()));
  }
  left_context->stdout_ = IoValue::pipe_end(std::move(pipe->write_));
  context.stdin_        = IoValue::pipe_end(std::move(pipe->read_));

  // Each side's context owns its pipe end and closes it once the side is
  // spawned, so the reader sees EOF when the last writer exits.
  auto left = start(node.left_, std::move(*left_context));
  if (!left) {
    return std::unexpected(std::move(left.error()));
  }

  auto right = start(node.right_, std::move(context));
  if (!right) {
    if (auto discarded = (*left)->wait(); !discarded) {
      log::debug("discarding left side error: {}", discarded.error().message());
    }
    return std::unexpected(std::move(right.error()));
  }
  return RunningPtr{std::make_unique<PipeRunning>(std::move(*left), std::move(*right))};
}

Result<RunningPtr> start_then(ThenNode const& node, Context context) {
  auto left_context = context.try_clone();
  if (!left_context) {
    return std::unexpected(std::move(left_context.error()));
  }
  auto left = start(node.left_, std::move(*left_context));
  if (!left) {
    return std::unexpected(std::move(left.error()));
  }
  return ThenRunning::start(std::move(*left), node.right_, std::move(context));
}

Result<IoValue> bind_target(Stream stream, Redirect const& target, Context const& context) {
  return std::visit(
      util::Overloaded{
          [](Redirect::Null const&) -> Result<IoValue> { return IoValue::null(); },
          // Opened once here, so every child below (then siblings, swapped
          // streams) shares one file description and offset.
          [&](Redirect::Path const& p) -> Result<IoValue> {
            auto fd = IoValue::path(p.path_).open_for(stream, context.dir_);
            if (!fd) {
              return std::unexpected(std::move(fd.error()));
            }
            return IoValue::owned(std::move(*fd));
          },
          [](Redirect::BorrowedFd const& b) -> Result<IoValue> { return IoValue::borrowed(b.fd_); },
          [](Redirect::OwnedFd const& o) -> Result<IoValue> {
            auto cloned = o.fd_->try_clone();
            if (!cloned) {
              return std::unexpected(Error::io(fmt::format("failed to duplicate descriptor {}", o.fd_->get()), cloned.error()));
            }
            return IoValue::owned(std::move(*cloned));
          },
          [&](Redirect::Capture const&) -> Result<IoValue> {
            auto& sink = stream == Stream::Stderr ? context.captures_->stderr_ : context.captures_->stdout_;
            return sink.connect();
          },
          [&](Redirect::Swap const&) -> Result<IoValue> {
            return stream == Stream::Stdout ? context.stderr_.try_clone() : context.stdout_.try_clone();
          },
          [&](Redirect::Bytes const&) -> Result<IoValue> {
            return std::unexpected(Error::io(fmt::format("input bytes cannot be bound to {}", to_string(stream)), EINVAL));
          },
      },
      target.value_
  );
}

Result<RunningPtr> start_input(IoNode const& node, std::shared_ptr<std::string const> const& bytes, Context context) {
  auto pipe = core::make_pipe();
  if (!pipe) {
    return std::unexpected(Error::io("failed to create stdin pipe", pipe.error()));
  }

  auto writer = ForwardingThread::writer(std::move(pipe->write_), bytes);
  if (!writer) {
    return std::unexpected(std::move(writer.error()));
  }
  context.stdin_ = IoValue::pipe_end(std::move(pipe->read_));

  auto inner = start(node.inner_, std::move(context));
  if (!inner) {
    // Every read end is closed by now, so the writer stops with EPIPE.
    if (auto discarded = writer->join(); !discarded) {
      log::debug("discarding input thread error: {}", discarded.error().message());
    }
    return std::unexpected(std::move(inner.error()));
  }
  return RunningPtr{std::make_unique<InputRunning>(std::move(*inner), std::move(*writer))};
}

Result<RunningPtr> start_io(IoNode const& node, Context context) {
  if (auto const* bytes = std::get_if<Redirect::Bytes>(&node.target_.value_)) {
    if (node.stream_ == Stream::Stdin) {
      return start_input(node, bytes->bytes_, std::move(context));
    }
  }

  auto value = bind_target(node.stream_, node.target_, context);
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  switch (node.stream_) {
    case Stream::Stdin: context.stdin_ = std::move(*value); break;
    case Stream::Stdout: context.stdout_ = std::move(*value); break;
    case Stream::Stderr: context.stderr_ = std::move(*value); break;
  }
  return start(node.inner_, std::move(context));
}

} // namespace

Context Context::ambient() {
  Context context{
      .stdin_    = IoValue::borrowed(STDIN_FILENO),
      .stdout_   = IoValue::borrowed(STDOUT_FILENO),
      .stderr_   = IoValue::borrowed(STDERR_FILENO),
      .env_      = core::environment_snapshot(),
      .dir_      = std::nullopt,
      .captures_ = std::make_shared<CaptureSinks>(),
  };

  if (auto cwd = core::syscall::get_current_directory()) {
    context.dir_ = std::move(*cwd);
  } else {
    log::debug("current directory unavailable: {}", std::strerror(cwd.error()));
  }
  return context;
}

Result<Context> Context::try_clone() const {
  auto in = stdin_.try_clone();
  if (!in) {
    return std::unexpected(std::move(in.error()));
  }
  auto out = stdout_.try_clone();
  if (!out) {
    return std::unexpected(std::move(out.error()));
  }
  auto err = stderr_.try_clone();
  if (!err) {
    return std::unexpected(std::move(err.error()));
  }
  return Context{
      .stdin_    = std::move(*in),
      .stdout_   = std::move(*out),
      .stderr_   = std::move(*err),
      .env_      = env_,
      .dir_      = dir_,
      .captures_ = captures_,
  };
}

Result<RunningPtr> start(Expression const& expression, Context context) {
  return std::visit(
      util::Overloaded{
          [&](CmdNode const& node) { return start_cmd(node, std::move(context)); },
          [&](PipeNode const& node) { return start_pipe(node, std::move(context)); },
          [&](ThenNode const& node) { return start_then(node, std::move(context)); },
          [&](IoNode const& node) { return start_io(node, std::move(context)); },
          [&](EnvNode const& node) {
            for (auto const& [name, value] : node.vars_) {
              context.env_.insert_or_assign(name, value);
            }
            return start(node.inner_, std::move(context));
          },
          [&](FullEnvNode const& node) {
            context.env_ = node.vars_;
            return start(node.inner_, std::move(context));
          },
          [&](DirNode const& node) {
            if (node.path_.is_relative() && context.dir_.has_value()) {
              context.dir_ = *context.dir_ / node.path_;
            } else {
              context.dir_ = node.path_;
            }
            return start(node.inner_, std::move(context));
          },
          [&](UncheckedNode const& node) -> Result<RunningPtr> {
            auto inner = start(node.inner_, std::move(context));
            if (!inner) {
              return std::unexpected(std::move(inner.error()));
            }
            return RunningPtr{std::make_unique<UncheckedRunning>(std::move(*inner))};
          },
      },
      expression.node().value_
  );
}

Execution::Execution(RunningPtr root, std::shared_ptr<CaptureSinks> captures) noexcept
    : root_(std::move(root)), captures_(std::move(captures)) {}

Execution::~Execution() {
  if (!waited_) {
    log::debug("handle dropped without wait, children are reaped in the background");
  }
}

Result<std::unique_ptr<Execution>> Execution::start(Expression const& expression) {
  auto context  = Context::ambient();
  auto captures = context.captures_;

  if (log::verbose()) {
    log::debug("starting {}", expression.to_string());
  }
  auto root = detail::start(expression, std::move(context));
  if (!root) {
    // Whatever did start has been waited; collect and drop any partial capture
    for (auto* sink : {&captures->stdout_, &captures->stderr_}) {
      if (auto discarded = sink->finish(); !discarded) {
        log::debug("discarding capture error: {}", discarded.error().message());
      }
    }
    return std::unexpected(std::move(root.error()));
  }
  return std::make_unique<Execution>(std::move(*root), std::move(captures));
}

Result<Output> Execution::wait() {
  if (waited_) {
    return std::unexpected(Error::io("handle was already waited", EINVAL));
  }
  waited_ = true;

  auto outcome         = root_->wait();
  auto captured_stdout = captures_->stdout_.finish();
  auto captured_stderr = captures_->stderr_.finish();

  if (!outcome) {
    return std::unexpected(std::move(outcome.error()));
  }
  if (!captured_stdout) {
    return std::unexpected(std::move(captured_stdout.error()));
  }
  if (!captured_stderr) {
    return std::unexpected(std::move(captured_stderr.error()));
  }

  Output output{outcome->status_, std::move(*captured_stdout), std::move(*captured_stderr)};
  if (outcome->is_checked_error()) {
    return std::unexpected(Error::status(std::move(output)));
  }
  return output;
}

} // namespace duct::detail
