#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

#include "execbridge/dispatcher.hpp"
#include "execbridge/options.hpp"
#include "execbridge/output.hpp"
#include "execbridge/registry.hpp"
#include "execbridge/result.hpp"
#include "execbridge/session.hpp"
#include "execbridge/sweeper.hpp"

namespace execbridge {

/// @brief Polling front end over interpreter runs.
///
/// Every call returns promptly: blocking pipe I/O happens only on the capture threads,
/// and the only bounded waits are execute()'s grace window and close() joining the
/// threads of a process it has just killed. All members are thread-safe.
///
/// @code
/// auto engine = execbridge::Engine::create_or_throw();
/// auto started = engine->execute("name = input('name: ')\nprint('hello', name)\n");
/// @endcode
class Engine {
 public:
  /// @brief Validate options, apply the log level and start the idle sweeper.
  static Result<std::unique_ptr<Engine>> create(EngineOptions options = {});
  /// @brief create() that throws on invalid options.
  static std::unique_ptr<Engine> create_or_throw(EngineOptions options = {});

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  /// @brief Calls shutdown().
  ~Engine();

  /// @brief Run source; DirectResult if it ends within the grace window, else SessionStarted.
  Result<ExecuteResult> execute(std::string_view source);

  /// @brief Chunks produced since the previous poll, in production order.
  ///
  /// Empty means nothing new yet. After the completion sentinel has been returned, the
  /// next poll returns empty and retires the session; later calls fail with
  /// errc::session_not_found.
  Result<std::vector<OutputChunk>> poll_output(std::string_view id);

  /// @brief True while the program has not exited.
  Result<bool> is_running(std::string_view id);

  /// @brief Send one line of input (a newline is appended).
  ///
  /// Fails with errc::closed_pipe once the program exited, errc::session_not_found for
  /// unknown ids.
  Result<void> send_input(std::string_view id, std::string_view text);

  /// @brief Kill, discard and forget a session. Unknown ids are ignored.
  void close(std::string_view id);

  /// @brief Detailed state, including the awaiting_input hint.
  Result<SessionState> status(std::string_view id);

  /// @brief One idle-eviction pass, for embedders that run their own scheduler.
  std::size_t sweep_idle();

  /// @brief Stop the sweeper and close every session. Idempotent.
  void shutdown() noexcept;

  /// @brief Number of live interactive sessions.
  [[nodiscard]] std::size_t session_count() const { return registry_.size(); }

  [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

 private:
  explicit Engine(EngineOptions options);
  [[nodiscard]] Result<std::shared_ptr<Session>> lookup(std::string_view id) const;

  EngineOptions options_;
  SessionRegistry registry_;
  Dispatcher dispatcher_;
  IdleSweeper sweeper_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace execbridge
