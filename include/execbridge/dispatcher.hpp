#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

#include "execbridge/interpreter.hpp"
#include "execbridge/registry.hpp"
#include "execbridge/result.hpp"
#include "execbridge/session.hpp"
#include "execbridge/status.hpp"

namespace execbridge {

/// @brief Output of a program that finished within the grace window.
struct DirectResult {
  /// @brief Everything the program wrote to stdout.
  std::string stdout_data;
  /// @brief Everything the program wrote to stderr.
  std::string stderr_data;
  /// @brief Exit code, or 128 + signal number.
  int exit_code = 0;
  /// @brief Full exit status.
  ExitStatus status;
};

/// @brief A program still running after the grace window; poll it by id.
struct SessionStarted {
  std::string id;
};

/// @brief Result of execute().
using ExecuteResult = std::variant<DirectResult, SessionStarted>;

/// @brief Classifies runs as direct or interactive by watching them for a grace window.
class Dispatcher {
 public:
  struct Options {
    Interpreter interpreter;
    std::chrono::milliseconds grace_window{750};
    SessionOptions session;
  };

  /// @brief Interactive sessions are inserted into registry, which must outlive this.
  Dispatcher(SessionRegistry& registry, Options options);

  /// @brief Start source and wait up to the grace window for it to finish.
  ///
  /// Staging and spawn failures are returned as errors and leave no session behind.
  /// A run that the engine itself failed to follow inside the window is returned as
  /// its error too.
  Result<ExecuteResult> dispatch(std::string_view source);

  [[nodiscard]] const Options& options() const noexcept { return options_; }

 private:
  static Result<ExecuteResult> collect_direct(Session& session);

  SessionRegistry& registry_;
  Options options_;
};

}  // namespace execbridge
