#include "execbridge/input.hpp"

#include <system_error>
#include <utility>

#include "execbridge/internal/backend.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

InputPump::InputPump(PipeWriter stdin_pipe) : pipe_(std::move(stdin_pipe)) {}

InputPump::~InputPump() { stop(); }

Result<void> InputPump::start() {
  internal::ignore_sigpipe_once();
  if (auto nonblocking = pipe_.set_nonblocking(); !nonblocking) {
    return std::unexpected(nonblocking.error());
  }
  auto stop_pipe = internal::create_pipe();
  if (!stop_pipe) {
    return fail(errc::pipe_failed, "input stop pipe: " + stop_pipe.error().code.message());
  }
  stop_read_ = std::move(stop_pipe->first);
  stop_write_ = std::move(stop_pipe->second);
  try {
    writer_ = std::thread(&InputPump::run, this);
  } catch (const std::system_error& ex) {
    return std::unexpected(Error{ex.code(), "start input writer"});
  }
  std::lock_guard lock(mutex_);
  started_ = true;
  return {};
}

Result<void> InputPump::enqueue(std::string_view bytes) {
  {
    std::lock_guard lock(mutex_);
    if (error_) {
      return std::unexpected(*error_);
    }
    if (stopping_ || !started_) {
      return fail(errc::closed_pipe, "stdin already closed");
    }
    queued_.append(bytes);
  }
  cv_.notify_one();
  return {};
}

std::size_t InputPump::pending() const {
  std::lock_guard lock(mutex_);
  return queued_.size() + in_flight_;
}

void InputPump::stop() noexcept {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    stopping_ = true;
    stop_write_.reset(-1);
  }
  cv_.notify_all();
  if (writer_.joinable()) {
    writer_.join();
  }
  pipe_.close();
}

void InputPump::run() {
  std::string batch;
  while (true) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queued_.empty(); });
      if (stopping_) {
        return;
      }
      batch.swap(queued_);
      in_flight_ = batch.size();
    }

    auto written = write_batch(batch);
    std::lock_guard lock(mutex_);
    in_flight_ = 0;
    if (!written) {
      if (written.error().code != make_error_code(errc::closed_pipe)) {
        logger()->warn("stdin write failed: {} ({})", written.error().context,
                       written.error().code.message());
      }
      error_ = written.error();
      queued_.clear();
      return;
    }
    if (!*written) {
      return;
    }
    batch.clear();
  }
}

// Returns false when stopped before the whole batch was accepted.
Result<bool> InputPump::write_batch(const std::string& batch) {
  std::size_t offset = 0;
  while (offset < batch.size()) {
    auto ready = pipe_.wait_writable(stop_read_.get());
    if (!ready) {
      return std::unexpected(ready.error());
    }
    if (!*ready) {
      return false;
    }
    auto count = pipe_.write_some(batch.data() + offset, batch.size() - offset);
    if (!count) {
      return std::unexpected(count.error());
    }
    offset += *count;
    std::lock_guard lock(mutex_);
    in_flight_ = batch.size() - offset;
  }
  return true;
}

}  // namespace execbridge
