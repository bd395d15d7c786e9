#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "execbridge/pipe.hpp"
#include "execbridge/result.hpp"
#include "execbridge/status.hpp"

namespace execbridge {

namespace internal {
/// @brief Internal access helper for ProcessHandle.
struct ProcessAccess;
}  // namespace internal

/// @brief Owner of one running interpreter process and its stdio pipes.
///
/// Status queries and kill() are safe to call from several threads; the pipes are
/// handed to whoever takes them. The process is reaped exactly once; later queries
/// answer from the cached status. Destroying a handle whose process
/// is still alive kills and reaps it.
class ProcessHandle {
 public:
  /// @brief Time between SIGTERM and SIGKILL in kill().
  static constexpr std::chrono::milliseconds kDefaultKillGrace{200};

  /// @brief Construct an empty handle.
  ProcessHandle();
  /// @brief Move-construct a handle.
  ProcessHandle(ProcessHandle&& other) noexcept;
  /// @brief Move-assign a handle.
  ProcessHandle& operator=(ProcessHandle&& other) noexcept;
  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;
  /// @brief Kill and reap a still-running process.
  ~ProcessHandle();

  /// @brief Process identifier.
  [[nodiscard]] int id() const noexcept;

  /// @brief Take ownership of the stdin pipe, if still present.
  std::optional<PipeWriter> take_stdin() noexcept;
  /// @brief Take ownership of the stdout pipe, if still present.
  std::optional<PipeReader> take_stdout() noexcept;
  /// @brief Take ownership of the stderr pipe, if still present.
  std::optional<PipeReader> take_stderr() noexcept;

  /// @brief Non-blocking liveness check; reaps the process if it has exited.
  Result<std::optional<ExitStatus>> try_exit_status();
  /// @brief Block until the process exits and return its status.
  Result<ExitStatus> wait();
  /// @brief SIGTERM, then SIGKILL after the kill grace, then reap. No-op once reaped.
  Result<void> kill();
  /// @brief Cached status of a reaped process.
  [[nodiscard]] std::optional<ExitStatus> exit_status() const;

  /// @brief Override the SIGTERM to SIGKILL grace period.
  void set_kill_grace(std::chrono::milliseconds grace) noexcept;

 private:
  /// @brief Opaque platform-specific implementation.
  struct Impl;
  /// @brief Owned implementation state.
  std::unique_ptr<Impl> impl_;

  friend struct internal::ProcessAccess;
};

}  // namespace execbridge
