#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "execbridge/internal/fd.hpp"
#include "execbridge/pipe.hpp"
#include "execbridge/result.hpp"

namespace execbridge {

/// @brief Background writer that feeds queued input into a program's stdin.
///
/// enqueue() only appends to a buffer, so a program that never reads its input cannot
/// stall the caller. The writer thread waits for the pipe to accept bytes and writes
/// without blocking; once the program's read end is gone every later enqueue() fails
/// with errc::closed_pipe.
class InputPump {
 public:
  /// @brief Take ownership of the stdin write end.
  explicit InputPump(PipeWriter stdin_pipe);
  InputPump(const InputPump&) = delete;
  InputPump& operator=(const InputPump&) = delete;
  /// @brief Calls stop().
  ~InputPump();

  /// @brief Make the pipe non-blocking and launch the writer thread.
  Result<void> start();

  /// @brief Queue bytes behind any input not yet written.
  Result<void> enqueue(std::string_view bytes);

  /// @brief Wake and join the writer, then close stdin. Unwritten input is dropped.
  void stop() noexcept;

  /// @brief Bytes queued but not yet accepted by the pipe.
  [[nodiscard]] std::size_t pending() const;

 private:
  void run();
  Result<bool> write_batch(const std::string& batch);

  PipeWriter pipe_;
  internal::unique_fd stop_read_;
  internal::unique_fd stop_write_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::string queued_;
  std::size_t in_flight_ = 0;
  bool started_ = false;
  bool stopping_ = false;
  bool stopped_ = false;
  std::optional<Error> error_;

  std::thread writer_;
};

}  // namespace execbridge
