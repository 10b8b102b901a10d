#include "duct/Forwarding.hpp"

#include <cerrno>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <unistd.h>

using namespace duct;
using namespace duct::detail;

TEST(Forwarding, BrokenPipeIsSuppressed) {
  Result<void> broken = std::unexpected(Error::io("write", EPIPE));
  EXPECT_TRUE(suppress_broken_pipe(std::move(broken)).has_value());
}

TEST(Forwarding, OtherErrorsPassThrough) {
  Result<void> failed = std::unexpected(Error::io("write", EIO));
  auto         result = suppress_broken_pipe(std::move(failed));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().error_code(), EIO);

  Result<void> spawn = std::unexpected(Error::spawn("spawn", EPIPE));
  EXPECT_FALSE(suppress_broken_pipe(std::move(spawn)).has_value());

  EXPECT_TRUE(suppress_broken_pipe(Result<void>{}).has_value());
}

TEST(Forwarding, ReaderCollectsUntilEof) {
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());

  auto reader = ForwardingThread::reader(std::move(pipe->read_), Stream::Stdout);
  ASSERT_TRUE(reader.has_value());
  EXPECT_TRUE(reader->joinable());

  std::string payload(100000, 'a');
  ASSERT_EQ(::write(pipe->write_.get(), payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
  pipe->write_.reset();

  auto collected = reader->join();
  ASSERT_TRUE(collected.has_value());
  EXPECT_EQ(*collected, payload);
  EXPECT_FALSE(reader->joinable());
}

TEST(Forwarding, WriterFeedsReader) {
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());

  auto bytes  = std::make_shared<std::string const>(300000, 'b');
  auto writer = ForwardingThread::writer(std::move(pipe->write_), bytes);
  auto reader = ForwardingThread::reader(std::move(pipe->read_), Stream::Stdout);
  ASSERT_TRUE(writer.has_value());
  ASSERT_TRUE(reader.has_value());

  auto written = writer->join();
  ASSERT_TRUE(written.has_value());
  EXPECT_TRUE(written->empty());

  auto collected = reader->join();
  ASSERT_TRUE(collected.has_value());
  EXPECT_EQ(*collected, *bytes);
}

TEST(Forwarding, WriterWithoutReaderIsNotAnError) {
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());
  pipe->read_.reset();

  auto writer = ForwardingThread::writer(std::move(pipe->write_), std::make_shared<std::string const>(1 << 20, 'c'));
  ASSERT_TRUE(writer.has_value());
  EXPECT_TRUE(writer->join().has_value());
}

TEST(Forwarding, JoinTwiceFails) {
  auto pipe = core::make_pipe();
  ASSERT_TRUE(pipe.has_value());
  pipe->write_.reset();

  auto reader = ForwardingThread::reader(std::move(pipe->read_), Stream::Stderr);
  ASSERT_TRUE(reader.has_value());
  ASSERT_TRUE(reader->join().has_value());

  auto again = reader->join();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().error_code(), EINVAL);
}

TEST(CaptureSink, UnusedSinkIsEmpty) {
  CaptureSink sink{Stream::Stdout};
  auto        captured = sink.finish();
  ASSERT_TRUE(captured.has_value());
  EXPECT_TRUE(captured->empty());
}

TEST(CaptureSink, ConnectionsShareOneBuffer) {
  CaptureSink sink{Stream::Stdout};
  {
    auto first  = sink.connect();
    auto second = sink.connect();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(first->holds<IoValue::PipeEnd>());

    int first_fd  = std::get<IoValue::PipeEnd>(first->value()).fd_.get();
    int second_fd = std::get<IoValue::PipeEnd>(second->value()).fd_.get();
    EXPECT_NE(first_fd, second_fd);
    ASSERT_EQ(::write(first_fd, "one ", 4), 4);
    ASSERT_EQ(::write(second_fd, "two", 3), 3);
  }

  auto captured = sink.finish();
  ASSERT_TRUE(captured.has_value());
  EXPECT_EQ(*captured, "one two");
}
