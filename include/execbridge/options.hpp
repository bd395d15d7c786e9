#pragma once

#include <spdlog/common.h>

#include <chrono>

#include "execbridge/interpreter.hpp"
#include "execbridge/result.hpp"

namespace execbridge {

/// @brief Engine configuration.
///
/// Defaults suit an interactive UI that polls about every 100 ms.
struct EngineOptions {
  static constexpr std::chrono::milliseconds kDefaultGraceWindow{750};
  static constexpr std::chrono::milliseconds kDefaultIdleTimeout{std::chrono::minutes(5)};
  static constexpr std::chrono::milliseconds kDefaultSweepInterval{1000};
  static constexpr std::chrono::milliseconds kDefaultAwaitingInputAfter{300};
  static constexpr std::chrono::milliseconds kDefaultExitDrainTimeout{500};

  /// @brief Interpreter that runs every program.
  Interpreter interpreter = Interpreter::python3();
  /// @brief How long execute() waits before treating a run as interactive.
  std::chrono::milliseconds grace_window = kDefaultGraceWindow;
  /// @brief Sessions without poll_output/send_input for this long are closed.
  std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;
  /// @brief Period of the idle sweeper.
  std::chrono::milliseconds sweep_interval = kDefaultSweepInterval;
  /// @brief Quiet period after which a running session reports awaiting_input.
  std::chrono::milliseconds awaiting_input_after = kDefaultAwaitingInputAfter;
  /// @brief How long output may trail the process exit before it is abandoned.
  std::chrono::milliseconds exit_drain_timeout = kDefaultExitDrainTimeout;
  /// @brief Level of the "execbridge" logger.
  spdlog::level::level_enum log_level = spdlog::level::warn;
  /// @brief Run the idle sweeper thread. Embedders with their own scheduler may call
  /// Engine::sweep_idle() instead.
  bool start_sweeper = true;

  /// @brief Defaults overridden by EXECBRIDGE_* environment variables.
  ///
  /// EXECBRIDGE_INTERPRETER, EXECBRIDGE_GRACE_WINDOW_MS, EXECBRIDGE_IDLE_TIMEOUT_MS,
  /// EXECBRIDGE_SWEEP_INTERVAL_MS, EXECBRIDGE_AWAITING_INPUT_MS and
  /// EXECBRIDGE_LOG_LEVEL. Malformed values yield errc::invalid_config.
  static Result<EngineOptions> from_env();

  /// @brief Reject empty interpreter programs and non-positive durations.
  [[nodiscard]] Result<void> validate() const;
};

}  // namespace execbridge
