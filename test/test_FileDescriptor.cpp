#include "duct/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace duct::core;

TEST(FileDescriptor, DestructorClosesFd) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int r = fds[0];
  {
    FileDescriptor fd(r);
  }
  // closing again should fail with EBADF
  errno  = 0;
  int rc = close(r);
  EXPECT_EQ(rc, -1);
  EXPECT_EQ(errno, EBADF);
  close(fds[1]);
}

TEST(FileDescriptor, BorrowedIsNotClosed) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  {
    FileDescriptor fd(fds[0], false);
    EXPECT_FALSE(fd.owning());
  }
  EXPECT_NE(fcntl(fds[0], F_GETFD), -1);
  close(fds[0]);
  close(fds[1]);
}

TEST(FileDescriptor, MoveSemantics) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int w = fds[1];
  {
    FileDescriptor a(fds[0]);
    FileDescriptor b(std::move(a));
    EXPECT_FALSE(a.valid());

    char c = 'x';
    ASSERT_EQ(write(w, &c, 1), 1) << std::strerror(errno);
    char buf{};
    ASSERT_EQ(read(b.get(), &buf, 1), 1) << std::strerror(errno);
    EXPECT_EQ(buf, 'x');
  }
  close(w);
}

TEST(FileDescriptor, DefaultConstructor) {
  FileDescriptor fd;
  EXPECT_EQ(fd.get(), -1);
  EXPECT_FALSE(fd.valid());
}

TEST(FileDescriptor, MoveAssignmentClosesPrevious) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor a(fds[0]);
  FileDescriptor b(fds[1]);

  b = std::move(a);

  char test_data = 'x';
  errno          = 0;
  EXPECT_EQ(write(fds[1], &test_data, 1), -1);
  EXPECT_EQ(errno, EBADF);

  EXPECT_EQ(a.get(), -1);
  EXPECT_EQ(b.get(), fds[0]);
}

TEST(FileDescriptor, SelfMoveAssignment) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int            original_fd = fd.get();

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wself-move"
  fd = std::move(fd);
#pragma GCC diagnostic pop

  EXPECT_EQ(fd.get(), original_fd);
  close(fds[1]);
}

TEST(FileDescriptor, Release) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int            original_fd = fd.release();

  EXPECT_EQ(original_fd, fds[0]);
  EXPECT_EQ(fd.get(), -1);

  // We're responsible for closing the released fd
  close(original_fd);
  close(fds[1]);
}

TEST(FileDescriptor, TryCloneIsIndependent) {
  auto pipe = make_pipe();
  ASSERT_TRUE(pipe.has_value());

  auto clone = pipe->write_.try_clone();
  ASSERT_TRUE(clone.has_value());
  EXPECT_NE(clone->get(), pipe->write_.get());
  EXPECT_TRUE(clone->owning());

  pipe->write_.reset();

  char c = 'z';
  ASSERT_EQ(write(clone->get(), &c, 1), 1);
  clone->reset();

  char buf{};
  EXPECT_EQ(read(pipe->read_.get(), &buf, 1), 1);
  EXPECT_EQ(buf, 'z');
  // every write end closed
  EXPECT_EQ(read(pipe->read_.get(), &buf, 1), 0);
}

TEST(FileDescriptor, TryCloneInvalidFails) {
  FileDescriptor fd;
  auto           clone = fd.try_clone();
  ASSERT_FALSE(clone.has_value());
  EXPECT_EQ(clone.error(), EBADF);
}

TEST(FileDescriptor, MakePipeIsCloseOnExec) {
  auto pipe = make_pipe();
  ASSERT_TRUE(pipe.has_value());
  EXPECT_TRUE(pipe->read_.valid());
  EXPECT_TRUE(pipe->write_.valid());
  EXPECT_NE(pipe->read_.get(), pipe->write_.get());
  EXPECT_TRUE(fcntl(pipe->read_.get(), F_GETFD) & FD_CLOEXEC);
  EXPECT_TRUE(fcntl(pipe->write_.get(), F_GETFD) & FD_CLOEXEC);
}
