#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "duct/Environment.hpp"
#include "duct/Error.hpp"
#include "duct/Expression.hpp"
#include "duct/Forwarding.hpp"
#include "duct/IoValue.hpp"
#include "duct/Output.hpp"
#include "duct/Resolver.hpp"

namespace duct::detail {

struct CaptureSinks {
  CaptureSink stdout_{Stream::Stdout};
  CaptureSink stderr_{Stream::Stderr};
};

// Bindings an expression is evaluated against. Each evaluation owns its copy;
// a node that needs to rebind a field changes its own copy only.
struct Context {
  IoValue                               stdin_;
  IoValue                               stdout_;
  IoValue                               stderr_;
  EnvMap                                env_;
  std::optional<std::filesystem::path>  dir_;
  std::shared_ptr<CaptureSinks>         captures_;

  // Calling process' stdio, environment and working directory, read now.
  [[nodiscard]] static Context ambient();

  [[nodiscard]] Result<Context> try_clone() const;
};

// A started subtree.
class Running {
public:
  virtual ~Running() = default;

  // Blocks until every process in the subtree has exited and every forwarding
  // thread attached to it has been joined. Called at most once.
  virtual Result<Outcome> wait() = 0;
};

using RunningPtr = std::unique_ptr<Running>;

// Spawns everything `expression` needs under `context`. The right side of a
// `then` is started by a sequencing thread once its left side has exited.
[[nodiscard]] Result<RunningPtr> start(Expression const& expression, Context context);

// One top-level evaluation: the started tree plus the shared capture buffers.
class Execution {
  RunningPtr                    root_;
  std::shared_ptr<CaptureSinks> captures_;
  bool                          waited_ = false;

public:
  Execution(RunningPtr root, std::shared_ptr<CaptureSinks> captures) noexcept;
  ~Execution();

  Execution(Execution const&)            = delete;
  Execution& operator=(Execution const&) = delete;
  Execution(Execution&&)                 = delete;
  Execution& operator=(Execution&&)      = delete;

  [[nodiscard]] static Result<std::unique_ptr<Execution>> start(Expression const& expression);

  [[nodiscard]] Result<Output> wait();
};

} // namespace duct::detail
