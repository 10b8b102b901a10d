#include "duct/Environment.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/Process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

using namespace duct;

namespace {

std::string read_to_end(int fd) {
  std::string         result;
  std::array<char, 256> buf{};
  ssize_t             n = 0;
  while ((n = ::read(fd, buf.data(), buf.size())) > 0) {
    result.append(buf.data(), static_cast<size_t>(n));
  }
  return result;
}

} // namespace

TEST(Process, ExitCode) {
  std::vector<std::string> argv{"/bin/sh", "-c", "exit 7"};
  auto                     child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, Stdio{});
  ASSERT_TRUE(child.has_value()) << child.error().to_string();
  EXPECT_GT(child->pid(), 0);
  EXPECT_EQ(child->program(), "/bin/sh");

  auto status = child->wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_FALSE(status->success());
  EXPECT_EQ(status->code(), 7);
  EXPECT_EQ(status->signal(), std::nullopt);
  EXPECT_EQ(status->shell_code(), 7);
  EXPECT_EQ(status->to_string(), "exit status: 7");
}

TEST(Process, KilledBySignal) {
  std::vector<std::string> argv{"/bin/sh", "-c", "kill -TERM $$"};
  auto                     child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, Stdio{});
  ASSERT_TRUE(child.has_value()) << child.error().to_string();

  auto status = child->wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_FALSE(status->success());
  EXPECT_EQ(status->code(), std::nullopt);
  EXPECT_EQ(status->signal(), SIGTERM);
  EXPECT_EQ(status->shell_code(), 128 + SIGTERM);
  EXPECT_EQ(status->to_string(), "signal: 15");
}

TEST(Process, MissingProgram) {
  std::vector<std::string> argv{"duct-test-no-such-program"};
  auto                     child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, Stdio{});
  ASSERT_FALSE(child.has_value());
  EXPECT_EQ(child.error().kind(), ErrorKind::SpawnFailure);
  EXPECT_EQ(child.error().error_code(), ENOENT);
  EXPECT_NE(child.error().message().find("duct-test-no-such-program"), std::string::npos);
}

TEST(Process, EmptyArgv) {
  std::vector<std::string> argv;
  auto                     child = Child::spawn(argv, {}, std::nullopt, Stdio{});
  ASSERT_FALSE(child.has_value());
  EXPECT_EQ(child.error().kind(), ErrorKind::SpawnFailure);
  EXPECT_EQ(child.error().error_code(), EINVAL);
}

TEST(Process, MissingDirectory) {
  std::vector<std::string> argv{"/bin/sh", "-c", "exit 0"};
  auto child = Child::spawn(argv, core::environment_snapshot(), "/duct-test-no-such-dir", Stdio{});
  ASSERT_FALSE(child.has_value());
  EXPECT_EQ(child.error().kind(), ErrorKind::SpawnFailure);
}

TEST(Process, StdoutIntoPipe) {
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());

  std::vector<std::string> argv{"/bin/sh", "-c", "echo $DUCT_PROCESS_TEST"};
  EnvMap                   env{{"DUCT_PROCESS_TEST", "hello"}};
  Stdio                    stdio;
  stdio.stdout_ = pipe->write_.get();

  auto child = Child::spawn(argv, env, std::nullopt, stdio);
  ASSERT_TRUE(child.has_value()) << child.error().to_string();
  pipe->write_.reset();

  EXPECT_EQ(read_to_end(pipe->read_.get()), "hello\n");
  auto status = child->wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->success());
}

TEST(Process, StdoutOntoStderrSlot) {
  // The child's stdout is our fd 2 and its stderr is our pipe: the source below
  // 3 must survive the dup2 onto fd 2.
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());

  std::vector<std::string> argv{"/bin/sh", "-c", "echo err >&2"};
  Stdio                    stdio;
  stdio.stdout_ = 2;
  stdio.stderr_ = pipe->write_.get();

  auto child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, stdio);
  ASSERT_TRUE(child.has_value()) << child.error().to_string();
  pipe->write_.reset();

  EXPECT_EQ(read_to_end(pipe->read_.get()), "err\n");
  ASSERT_TRUE(child->wait().has_value());
}

TEST(Process, WaitTwiceFails) {
  std::vector<std::string> argv{"/bin/sh", "-c", "exit 0"};
  auto                     child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, Stdio{});
  ASSERT_TRUE(child.has_value());
  ASSERT_TRUE(child->wait().has_value());

  auto again = child->wait();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind(), ErrorKind::IoFailure);
  EXPECT_EQ(again.error().error_code(), ECHILD);
}

TEST(Process, AbandonedChildDoesNotBlock) {
  std::vector<std::string> argv{"/bin/sh", "-c", "sleep 0.2"};
  {
    auto child = Child::spawn(argv, core::environment_snapshot(), std::nullopt, Stdio{});
    ASSERT_TRUE(child.has_value());
  }
  SUCCEED();
}
