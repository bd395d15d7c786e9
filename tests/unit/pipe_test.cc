#include "execbridge/pipe.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <string>

#include "execbridge/internal/fd.hpp"
#include "support/test_support.hpp"

namespace execbridge {

TEST(PipeTest, WriteSomeThenReadToEnd) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  auto read_fd = pipe_result->first.release();
  auto write_fd = pipe_result->second.release();

  PipeReader reader(read_fd);
  PipeWriter writer(write_fd);

  std::string payload = "name: Bob\n";
  auto write_result = writer.write_some(payload.data(), payload.size());
  ASSERT_TRUE(write_result.has_value());
  EXPECT_EQ(*write_result, payload.size());
  writer.close();

  EXPECT_EQ(test::read_to_end(reader), payload);
}

TEST(PipeTest, PipeFdsAreCloexec) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());

  int read_flags = ::fcntl(pipe_result->first.get(), F_GETFD);
  ASSERT_NE(read_flags, -1);
  EXPECT_TRUE((read_flags & FD_CLOEXEC) != 0);

  int write_flags = ::fcntl(pipe_result->second.get(), F_GETFD);
  ASSERT_NE(write_flags, -1);
  EXPECT_TRUE((write_flags & FD_CLOEXEC) != 0);
}

TEST(PipeTest, WriteAfterReaderClosedIsClosedPipe) {
  std::signal(SIGPIPE, SIG_IGN);
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  PipeReader reader(pipe_result->first.release());
  PipeWriter writer(pipe_result->second.release());
  reader.close();

  std::string late = "late input\n";
  auto write_result = writer.write_some(late.data(), late.size());
  ASSERT_FALSE(write_result.has_value());
  EXPECT_EQ(write_result.error().code, make_error_code(errc::closed_pipe));
}

TEST(PipeTest, ClosedWriterReportsClosedPipe) {
  PipeWriter writer;
  auto write_result = writer.write_some("x", 1);
  ASSERT_FALSE(write_result.has_value());
  EXPECT_EQ(write_result.error().code, make_error_code(errc::closed_pipe));
}

TEST(PipeTest, NonBlockingWriterReturnsZeroWhenFull) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  PipeReader reader(pipe_result->first.release());
  PipeWriter writer(pipe_result->second.release());
  ASSERT_TRUE(writer.set_nonblocking().has_value());
  EXPECT_TRUE((::fcntl(writer.native_handle(), F_GETFL) & O_NONBLOCK) != 0);

  std::string block(4096, 'x');
  std::size_t total = 0;
  while (true) {
    auto written = writer.write_some(block.data(), block.size());
    ASSERT_TRUE(written.has_value());
    if (*written == 0) {
      break;
    }
    total += *written;
    ASSERT_LT(total, 64u * 1024u * 1024u);
  }
  EXPECT_GT(total, 0u);
}

TEST(PipeTest, WaitWritableIsCancelledByStopDescriptor) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  PipeReader reader(pipe_result->first.release());
  PipeWriter writer(pipe_result->second.release());
  ASSERT_TRUE(writer.set_nonblocking().has_value());
  std::string block(4096, 'x');
  while (writer.write_some(block.data(), block.size()).value_or(0) > 0) {
  }

  auto stop = internal::create_pipe();
  ASSERT_TRUE(stop.has_value());
  stop->second.reset(-1);
  auto ready = writer.wait_writable(stop->first.get());
  ASSERT_TRUE(ready.has_value());
  EXPECT_FALSE(*ready);
}

TEST(PipeTest, WaitReadableSeesDataAndCancellation) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  PipeReader reader(pipe_result->first.release());
  PipeWriter writer(pipe_result->second.release());
  auto stop = internal::create_pipe();
  ASSERT_TRUE(stop.has_value());

  ASSERT_EQ(writer.write_some("hi", 2).value_or(0), 2u);
  auto ready = reader.wait_readable(stop->first.get());
  ASSERT_TRUE(ready.has_value());
  EXPECT_TRUE(*ready);

  // Cancellation wins even though "hi" is still unread.
  stop->second.reset(-1);
  auto cancelled = reader.wait_readable(stop->first.get());
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_FALSE(*cancelled);
}

TEST(PipeTest, ReadSomeReturnsZeroAtEof) {
  auto pipe_result = internal::create_pipe();
  ASSERT_TRUE(pipe_result.has_value());
  PipeReader reader(pipe_result->first.release());
  pipe_result->second.reset(-1);

  char buffer[16];
  auto count = reader.read_some(buffer, sizeof(buffer));
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 0u);
}

}  // namespace execbridge
