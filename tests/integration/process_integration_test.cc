#include <fcntl.h>
#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>

#include "execbridge/capture.hpp"
#include "execbridge/command.hpp"
#include "execbridge/output.hpp"
#include "execbridge/process.hpp"
#include "support/test_support.hpp"

namespace execbridge {
namespace {

ProcessHandle spawn_shell(const std::string& script) {
  Command cmd("/bin/sh");
  cmd.arg("-c").arg(script);
  return cmd.spawn_or_throw();
}

bool process_gone(int pid) { return ::kill(pid, 0) == -1 && errno == ESRCH; }

}  // namespace

TEST(ProcessIntegrationTest, MissingInterpreterIsSpawnFailed) {
  auto process = Command("/nonexistent/execbridge-python").spawn();
  ASSERT_FALSE(process.has_value());
  EXPECT_EQ(process.error().code, make_error_code(errc::spawn_failed));
  EXPECT_NE(process.error().context.find("No such file or directory"), std::string::npos)
      << process.error().context;
}

TEST(ProcessIntegrationTest, StdinPipeFeedsTheProgram) {
  auto process = spawn_shell("read name; echo \"got $name\"");
  auto out = process.take_stdout();
  auto in = process.take_stdin();
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(in.has_value());
  auto written = in->write_some("abc\n", 4);
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, 4u);
  in->close();

  EXPECT_EQ(test::read_to_end(*out), "got abc\n");
  auto status = process.wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->success());
}

TEST(ProcessIntegrationTest, WriteToProgramThatClosedStdinDoesNotKillHost) {
  auto process = spawn_shell("exec 0<&-; sleep 5");
  auto in = process.take_stdin();
  ASSERT_TRUE(in.has_value());
  // The program closes stdin right away; keep writing until EPIPE shows up.
  Result<std::size_t> written;
  ASSERT_TRUE(test::eventually([&] {
    written = in->write_some("x\n", 2);
    return !written.has_value();
  }));
  EXPECT_EQ(written.error().code, make_error_code(errc::closed_pipe));
  ASSERT_TRUE(process.kill().has_value());
}

TEST(ProcessIntegrationTest, WorkingDirSpawnDoesNotLeakHostDescriptors) {
  if (!std::filesystem::exists("/proc/self/fd")) {
    GTEST_SKIP() << "needs /proc";
  }
  // Without O_CLOEXEC and far above anything the shell opens itself, so only the
  // explicit close in the forked child keeps it out.
  int null_fd = ::open("/dev/null", O_RDONLY);
  ASSERT_GE(null_fd, 0);
  int stray = ::fcntl(null_fd, F_DUPFD, 200);
  ::close(null_fd);
  ASSERT_GE(stray, 200);
  const std::string fd_path = "/proc/self/fd/" + std::to_string(stray);

  Command cmd("/bin/sh");
  cmd.arg("-c").arg("if [ -e " + fd_path + " ]; then echo leaked; else echo closed; fi; pwd");
  cmd.current_dir(std::filesystem::temp_directory_path());
  auto process = cmd.spawn_or_throw();
  auto out = process.take_stdout();
  ASSERT_TRUE(out.has_value());
  auto text = test::read_to_end(*out);
  ::close(stray);

  auto canonical_tmp = std::filesystem::canonical(std::filesystem::temp_directory_path());
  EXPECT_EQ(text, "closed\n" + canonical_tmp.string() + "\n");
  ASSERT_TRUE(process.wait().has_value());
}

TEST(ProcessIntegrationTest, WorkingDirSpawnStillReportsExecFailure) {
  Command cmd("/nonexistent/execbridge-python");
  cmd.current_dir(std::filesystem::temp_directory_path());
  auto process = cmd.spawn();
  ASSERT_FALSE(process.has_value());
  EXPECT_EQ(process.error().code, make_error_code(errc::spawn_failed));
  EXPECT_NE(process.error().context.find("No such file or directory"), std::string::npos)
      << process.error().context;
}

TEST(ProcessIntegrationTest, KillIsIdempotentAndReportsSignal) {
  auto process = spawn_shell("sleep 30");
  ASSERT_TRUE(process.kill().has_value());
  auto status = process.exit_status();
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->signal().has_value());
  EXPECT_GE(status->display_code(), 128);
  ASSERT_TRUE(process.kill().has_value());
  auto again = process.try_exit_status();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->value(), *status);
}

TEST(ProcessIntegrationTest, KillReachesGrandchildrenHoldingThePipe) {
  auto process = spawn_shell("sleep 30 & sleep 30");
  auto out = process.take_stdout();
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(process.kill().has_value());
  // Both sleeps share stdout; EOF means the whole group is gone.
  EXPECT_EQ(test::read_to_end(*out), "");
}

TEST(ProcessIntegrationTest, DestroyingHandleKillsAndReaps) {
  int pid = -1;
  {
    auto process = spawn_shell("sleep 30");
    pid = process.id();
    ASSERT_GT(pid, 0);
  }
  int status = 0;
  EXPECT_EQ(::waitpid(pid, &status, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);
  EXPECT_TRUE(process_gone(pid));
}

TEST(OutputCaptureIntegrationTest, StreamsAreTaggedAndSentinelComesLast) {
  auto process = spawn_shell("echo out; echo err 1>&2; exit 3");
  OutputQueue queue;
  OutputCapture capture(process, queue, std::chrono::milliseconds(500));
  ASSERT_TRUE(capture.start().has_value());
  ASSERT_TRUE(test::eventually([&] { return capture.finished(); }));

  auto chunks = queue.drain();
  ASSERT_FALSE(chunks.empty());
  EXPECT_EQ(test::text_of(chunks, OutputStream::stdout_stream), "out\n");
  EXPECT_EQ(test::text_of(chunks, OutputStream::stderr_stream), "err\n");
  EXPECT_EQ(chunks.back().stream, OutputStream::completion);
  EXPECT_EQ(chunks.back().exit_code, 3);
  EXPECT_EQ(chunks.back().text, "\n[Program exited with error] (exit code 3)");

  auto outcome = capture.outcome();
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->has_value());
  EXPECT_EQ((*outcome)->code().value_or(-1), 3);
}

TEST(OutputCaptureIntegrationTest, InvalidUtf8IsReplacedNotFatal) {
  auto process = spawn_shell("printf 'a\\377b\\303\\251'");
  OutputQueue queue;
  OutputCapture capture(process, queue, std::chrono::milliseconds(500));
  ASSERT_TRUE(capture.start().has_value());
  ASSERT_TRUE(test::eventually([&] { return capture.finished(); }));

  auto chunks = queue.drain();
  EXPECT_EQ(test::text_of(chunks, OutputStream::stdout_stream), "a\xEF\xBF\xBD" "b\xC3\xA9");
  EXPECT_EQ(capture.replacements(), 1u);
  EXPECT_EQ(chunks.back().text, "\n[Program finished successfully]");
}

TEST(OutputCaptureIntegrationTest, LingeringGrandchildDoesNotHoldCompletion) {
  auto process = spawn_shell("sleep 3 & echo parent done");
  OutputQueue queue;
  OutputCapture capture(process, queue, std::chrono::milliseconds(200));
  ASSERT_TRUE(capture.start().has_value());
  ASSERT_TRUE(test::eventually([&] { return capture.finished(); }, std::chrono::seconds(2)));

  auto chunks = queue.drain();
  EXPECT_EQ(test::text_of(chunks, OutputStream::stdout_stream), "parent done\n");
  EXPECT_EQ(chunks.back().stream, OutputStream::completion);
}

TEST(OutputCaptureIntegrationTest, StopKillsRunningProgram) {
  auto process = spawn_shell("echo started; sleep 30");
  OutputQueue queue;
  OutputCapture capture(process, queue, std::chrono::milliseconds(500));
  ASSERT_TRUE(capture.start().has_value());
  ASSERT_TRUE(test::eventually([&] { return queue.size() > 0; }));

  capture.stop();
  EXPECT_TRUE(process.exit_status().has_value());
  EXPECT_TRUE(process_gone(process.id()));
  capture.stop();
}

}  // namespace execbridge
