#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "duct/Environment.hpp"
#include "duct/Expression.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/IoValue.hpp"

namespace duct::detail {

struct CmdNode {
  std::vector<std::string> argv_;
  EnvMap                   env_;
};

struct PipeNode {
  Expression left_;
  Expression right_;
};

struct ThenNode {
  Expression left_;
  Expression right_;
};

// What an Io node binds its stream to. Bytes is only valid for stdin; Capture
// and Swap only for stdout/stderr (Swap means "the other output stream").
struct Redirect {
  struct Null {};
  struct Path {
    std::filesystem::path path_;
  };
  struct OwnedFd {
    std::shared_ptr<core::FileDescriptor const> fd_;
  };
  struct BorrowedFd {
    int fd_;
  };
  struct Bytes {
    std::shared_ptr<std::string const> bytes_;
  };
  struct Capture {};
  struct Swap {};

  std::variant<Null, Path, OwnedFd, BorrowedFd, Bytes, Capture, Swap> value_;
};

struct IoNode {
  Stream     stream_;
  Redirect   target_;
  Expression inner_;
};

struct EnvNode {
  EnvMap     vars_;
  Expression inner_;
};

struct FullEnvNode {
  EnvMap     vars_;
  Expression inner_;
};

struct DirNode {
  std::filesystem::path path_;
  Expression            inner_;
};

struct UncheckedNode {
  Expression inner_;
};

struct Node {
  std::variant<CmdNode, PipeNode, ThenNode, IoNode, EnvNode, FullEnvNode, DirNode, UncheckedNode> value_;
};

} // namespace duct::detail
