#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/capture.hpp"
#include "execbridge/input.hpp"
#include "execbridge/internal/clock.hpp"
#include "execbridge/interpreter.hpp"
#include "execbridge/output.hpp"
#include "execbridge/process.hpp"
#include "execbridge/result.hpp"
#include "execbridge/status.hpp"

namespace execbridge {

/// @brief Lifecycle state of a session as seen by callers.
enum class SessionStateKind : std::uint8_t {
  /// @brief Process alive and recently produced output or received input.
  running,
  /// @brief Process alive and quiet for a while; probably blocked reading stdin.
  awaiting_input,
  /// @brief Process exited; see SessionState::exit.
  completed,
  /// @brief The engine could not follow the run; see SessionState::error.
  failed,
  /// @brief Closed by the caller or evicted.
  closed,
};

/// @brief Snapshot of a session's state.
struct SessionState {
  SessionStateKind kind = SessionStateKind::running;
  /// @brief Set when kind is completed.
  std::optional<ExitStatus> exit;
  /// @brief Set when kind is failed.
  std::optional<Error> error;
  /// @brief Invalid UTF-8 sequences replaced in the output so far.
  std::size_t decode_replacements = 0;

  /// @brief True for running and awaiting_input.
  [[nodiscard]] bool is_running() const noexcept {
    return kind == SessionStateKind::running || kind == SessionStateKind::awaiting_input;
  }
};

/// @brief Name of a state kind, e.g. "awaiting_input".
std::string_view to_string(SessionStateKind kind) noexcept;

/// @brief Timing knobs a session needs from the engine options.
struct SessionOptions {
  std::chrono::milliseconds exit_drain_timeout{500};
  std::chrono::milliseconds awaiting_input_after{300};
};

/// @brief One running program: its process, output capture, queue and staged script.
///
/// The session owns its process exclusively; callers reach the pipes only through
/// poll(), send_input() and close(). Destroying a session closes it.
class Session {
 public:
  /// @brief Stage source, spawn the interpreter and start capturing its output.
  static Result<std::shared_ptr<Session>> start(std::string_view source,
                                                const Interpreter& interpreter,
                                                SessionOptions options);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  ~Session();

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] int pid() const noexcept { return process_.id(); }

  /// @brief Take everything queued since the previous poll.
  ///
  /// Returns std::nullopt once the completion sentinel has already been handed out by
  /// an earlier poll; the caller then retires the session. Polls are linearized.
  std::optional<std::vector<OutputChunk>> poll();

  /// @brief Drain the queue unconditionally (used for direct results).
  std::vector<OutputChunk> drain_all();

  /// @brief Queue text plus a newline for the program's stdin.
  ///
  /// Never waits for the program to read; errc::closed_pipe once it exited or its
  /// stdin is gone.
  Result<void> send_input(std::string_view text);

  /// @brief Current state; awaiting_input is a timing heuristic.
  [[nodiscard]] SessionState state() const;

  /// @brief True once the process exited and the sentinel is queued.
  [[nodiscard]] bool finished() const noexcept { return capture_ && capture_->finished(); }

  /// @brief Kill the process if alive, join the capture and input threads, drop queued
  /// output and input, and remove the staged script. Idempotent.
  void close() noexcept;

  /// @brief Time of the last poll or send_input.
  [[nodiscard]] internal::Clock::time_point last_activity() const;

 private:
  Session(std::string id, SessionOptions options);
  void touch();

  std::string id_;
  SessionOptions options_;
  internal::Clock::time_point created_at_;

  std::optional<ScriptFile> script_;
  ProcessHandle process_;
  OutputQueue queue_;
  // Declared after process_ and queue_ so they are destroyed first.
  std::unique_ptr<OutputCapture> capture_;
  std::unique_ptr<InputPump> input_;

  mutable std::mutex activity_mutex_;
  internal::Clock::time_point last_activity_;
  internal::Clock::time_point last_input_;

  std::mutex poll_mutex_;
  bool sentinel_delivered_ = false;

  std::mutex close_mutex_;
  std::atomic<bool> closed_{false};
};

}  // namespace execbridge
