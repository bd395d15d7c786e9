#include "execbridge/capture.hpp"

#include <array>
#include <string>
#include <system_error>
#include <utility>

#include "execbridge/log.hpp"
#include "execbridge/utf8.hpp"

namespace execbridge {

namespace {

constexpr std::size_t kReadBufferSize = 8192;

const char* stream_name(OutputStream stream) {
  return stream == OutputStream::stderr_stream ? "stderr" : "stdout";
}

}  // namespace

OutputCapture::OutputCapture(ProcessHandle& process, OutputQueue& queue,
                             std::chrono::milliseconds exit_drain_timeout)
    : process_(process), queue_(queue), exit_drain_timeout_(exit_drain_timeout) {}

OutputCapture::~OutputCapture() { stop(); }

Result<void> OutputCapture::start() {
  auto stop_pipe = internal::create_pipe();
  if (!stop_pipe) {
    return fail(errc::pipe_failed, "capture stop pipe: " + stop_pipe.error().code.message());
  }
  stop_read_ = std::move(stop_pipe->first);
  stop_write_ = std::move(stop_pipe->second);

  auto stdout_pipe = process_.take_stdout();
  auto stderr_pipe = process_.take_stderr();
  {
    std::lock_guard lock(state_mutex_);
    open_streams_ = (stdout_pipe ? 1 : 0) + (stderr_pipe ? 1 : 0);
  }

  try {
    if (stdout_pipe) {
      stdout_reader_ = std::thread(&OutputCapture::read_loop, this, std::move(*stdout_pipe),
                                   OutputStream::stdout_stream);
    }
    if (stderr_pipe) {
      stderr_reader_ = std::thread(&OutputCapture::read_loop, this, std::move(*stderr_pipe),
                                   OutputStream::stderr_stream);
    }
    watcher_ = std::thread(&OutputCapture::watch_exit, this);
  } catch (const std::system_error& ex) {
    stop();
    return std::unexpected(Error{ex.code(), "start capture thread"});
  }
  return {};
}

void OutputCapture::read_loop(PipeReader pipe, OutputStream stream) {
  Utf8Decoder decoder;
  std::size_t counted = 0;
  std::array<char, kReadBufferSize> buffer{};

  while (true) {
    // Stop wins over pending data so a chatty grandchild cannot hold the reader.
    auto ready = pipe.wait_readable(stop_read_.get());
    if (!ready) {
      record_error(ready.error());
      break;
    }
    if (!*ready) {
      break;
    }
    auto count = pipe.read_some(buffer.data(), buffer.size());
    if (!count) {
      record_error(count.error());
      break;
    }
    if (*count == 0) {
      break;
    }
    auto text = decoder.decode(std::string_view(buffer.data(), *count));
    if (decoder.replacements() > counted) {
      replacements_.fetch_add(decoder.replacements() - counted, std::memory_order_relaxed);
      counted = decoder.replacements();
    }
    if (!text.empty()) {
      queue_.push(OutputChunk{stream, std::move(text), std::nullopt});
    }
  }

  if (auto tail = decoder.finish(); !tail.empty()) {
    queue_.push(OutputChunk{stream, std::move(tail), std::nullopt});
  }
  if (decoder.replacements() > 0) {
    replacements_.fetch_add(decoder.replacements() - counted, std::memory_order_relaxed);
    logger()->debug("pid {}: replaced {} invalid UTF-8 sequence(s) on {}", process_.id(),
                    decoder.replacements(), stream_name(stream));
  }
  pipe.close();

  {
    std::lock_guard lock(state_mutex_);
    --open_streams_;
  }
  eof_cv_.notify_all();
}

void OutputCapture::watch_exit() {
  auto status = process_.wait();
  if (!status) {
    logger()->warn("pid {}: wait failed: {} ({})", process_.id(), status.error().context,
                   status.error().code.message());
    if (auto killed = process_.kill(); !killed) {
      logger()->warn("pid {}: {}", process_.id(), killed.error().context);
    }
  }

  {
    std::unique_lock lock(state_mutex_);
    bool drained =
        eof_cv_.wait_for(lock, exit_drain_timeout_, [this] { return open_streams_ == 0; });
    if (!drained) {
      logger()->debug("pid {}: output pipes still open {} ms after exit; abandoning them",
                      process_.id(), exit_drain_timeout_.count());
    }
  }
  signal_stop();
  join_readers();

  Result<ExitStatus> result = status;
  {
    std::lock_guard lock(state_mutex_);
    if (result && reader_error_) {
      result = std::unexpected(*reader_error_);
    }
  }
  // Publishing under the queue lock keeps the sentinel and the terminal state in step.
  queue_.push_final(result ? completion_chunk(*result) : failure_chunk(), [&] {
    std::lock_guard lock(state_mutex_);
    outcome_ = result;
    finished_.store(true, std::memory_order_release);
  });
  if (result) {
    logger()->debug("pid {}: finished with {}", process_.id(), to_string(*result));
  }
}

void OutputCapture::record_error(Error error) {
  logger()->warn("pid {}: output capture failed: {} ({})", process_.id(), error.context,
                 error.code.message());
  {
    std::lock_guard lock(state_mutex_);
    if (!reader_error_) {
      reader_error_ = std::move(error);
    }
  }
  // Without a reader the run cannot be followed; end it so the watcher publishes.
  if (auto killed = process_.kill(); !killed) {
    logger()->warn("pid {}: {}", process_.id(), killed.error().context);
  }
}

void OutputCapture::signal_stop() noexcept {
  std::lock_guard lock(stop_mutex_);
  stop_write_.reset(-1);
}

void OutputCapture::join_readers() noexcept {
  if (stdout_reader_.joinable()) {
    stdout_reader_.join();
  }
  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }
}

void OutputCapture::stop() noexcept {
  if (stopped_.exchange(true)) {
    return;
  }
  if (auto killed = process_.kill(); !killed) {
    logger()->warn("pid {}: {}", process_.id(), killed.error().context);
  }
  signal_stop();
  if (watcher_.joinable()) {
    watcher_.join();
  } else {
    join_readers();
  }
}

std::optional<Result<ExitStatus>> OutputCapture::outcome() const {
  std::lock_guard lock(state_mutex_);
  return outcome_;
}

}  // namespace execbridge
