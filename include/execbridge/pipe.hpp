#pragma once

#include <cstddef>

#include "execbridge/result.hpp"

namespace execbridge {

/// @brief Read end of one of the program's output pipes.
///
/// Owned by a capture thread; the blocking wait can be cancelled through a second
/// descriptor so the pipe itself is never closed under a reader.
class PipeReader {
 public:
  /// @brief Construct an empty reader.
  PipeReader() = default;
  /// @brief Construct from a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  /// @brief Move-construct a reader.
  PipeReader(PipeReader&& other) noexcept;
  /// @brief Move-assign a reader.
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  /// @brief Destroy the reader and close if needed.
  ~PipeReader();

  /// @brief Native file descriptor handle.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief Close the pipe.
  void close() noexcept;

  /// @brief Block until data, EOF or an error is pending, or cancel_fd turns readable.
  ///
  /// Returns false when cancelled. Cancellation wins over pending data.
  [[nodiscard]] Result<bool> wait_readable(int cancel_fd) const;
  /// @brief Read up to n bytes into data; 0 means EOF.
  [[nodiscard]] Result<std::size_t> read_some(void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

/// @brief Write end of the program's stdin pipe.
class PipeWriter {
 public:
  /// @brief Construct an empty writer.
  PipeWriter() = default;
  /// @brief Construct from a native file descriptor.
  explicit PipeWriter(int fd) : fd_(fd) {}
  /// @brief Move-construct a writer.
  PipeWriter(PipeWriter&& other) noexcept;
  /// @brief Move-assign a writer.
  PipeWriter& operator=(PipeWriter&& other) noexcept;
  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;
  /// @brief Destroy the writer and close if needed (the program sees EOF).
  ~PipeWriter();

  /// @brief Native file descriptor handle.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief Close the pipe.
  void close() noexcept;

  /// @brief Switch to O_NONBLOCK so write_some never parks the calling thread.
  [[nodiscard]] Result<void> set_nonblocking() const;
  /// @brief Block until the pipe accepts bytes or cancel_fd turns readable.
  ///
  /// Returns false when cancelled. A vanished reader counts as writable; the next
  /// write reports it.
  [[nodiscard]] Result<bool> wait_writable(int cancel_fd) const;
  /// @brief Write up to n bytes from data.
  ///
  /// Returns 0 when a non-blocking pipe is full. Fails with errc::closed_pipe when the
  /// read end is gone (EPIPE); SIGPIPE must be ignored by the host process for this to
  /// be reported instead of killing it.
  [[nodiscard]] Result<std::size_t> write_some(const void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

}  // namespace execbridge
