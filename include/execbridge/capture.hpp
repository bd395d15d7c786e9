#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>

#include "execbridge/internal/fd.hpp"
#include "execbridge/output.hpp"
#include "execbridge/pipe.hpp"
#include "execbridge/process.hpp"
#include "execbridge/result.hpp"
#include "execbridge/status.hpp"

namespace execbridge {

/// @brief Background readers that move a process's stdout and stderr into an OutputQueue.
///
/// start() takes the process's output pipes and launches three threads: one reader per
/// pipe and an exit watcher. Readers decode incrementally and push every non-empty piece
/// of text. When the process exits the watcher waits up to the drain timeout for both
/// pipes to reach end-of-file, stops the readers, then appends the completion sentinel
/// and publishes the outcome atomically with respect to drains. Callers never block on the child through this class
/// except in stop().
class OutputCapture {
 public:
  /// @brief Attach to process and queue; both must outlive the capture.
  OutputCapture(ProcessHandle& process, OutputQueue& queue,
                std::chrono::milliseconds exit_drain_timeout);
  OutputCapture(const OutputCapture&) = delete;
  OutputCapture& operator=(const OutputCapture&) = delete;
  /// @brief Calls stop().
  ~OutputCapture();

  /// @brief Take the output pipes and start the background threads.
  Result<void> start();

  /// @brief Kill the process if still alive and join every background thread.
  ///
  /// Idempotent. Output that has not been read yet is abandoned.
  void stop() noexcept;

  /// @brief True once the outcome is published; the sentinel is queued in the same step.
  [[nodiscard]] bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

  /// @brief Exit status of the process, or the internal error that ended the run.
  ///
  /// Empty until finished().
  [[nodiscard]] std::optional<Result<ExitStatus>> outcome() const;

  /// @brief Invalid UTF-8 sequences replaced so far, over both streams.
  [[nodiscard]] std::size_t replacements() const noexcept {
    return replacements_.load(std::memory_order_relaxed);
  }

 private:
  void read_loop(PipeReader pipe, OutputStream stream);
  void watch_exit();
  void record_error(Error error);
  void signal_stop() noexcept;
  void join_readers() noexcept;

  ProcessHandle& process_;
  OutputQueue& queue_;
  std::chrono::milliseconds exit_drain_timeout_;

  std::mutex stop_mutex_;
  internal::unique_fd stop_read_;
  internal::unique_fd stop_write_;

  mutable std::mutex state_mutex_;
  std::condition_variable eof_cv_;
  int open_streams_ = 0;
  std::optional<Error> reader_error_;
  std::optional<Result<ExitStatus>> outcome_;

  std::atomic<bool> finished_{false};
  std::atomic<std::size_t> replacements_{0};
  std::atomic<bool> stopped_{false};

  std::thread stdout_reader_;
  std::thread stderr_reader_;
  std::thread watcher_;
};

}  // namespace execbridge
