#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "execbridge/internal/clock.hpp"
#include "execbridge/result.hpp"
#include "execbridge/status.hpp"

namespace execbridge::internal {

struct WaitOps {
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> terminate;
  std::function<Result<void>()> kill;
};

/// SIGTERM, poll for up to kill_grace, then SIGKILL and a blocking reap.
Result<ExitStatus> terminate_and_reap(WaitOps& ops, Clock& clock,
                                      std::chrono::milliseconds kill_grace);

/// Polls done() every step until it returns true or timeout elapses on clock.
bool wait_until(Clock& clock, std::chrono::milliseconds timeout, std::chrono::milliseconds step,
                const std::function<bool()>& done);

}  // namespace execbridge::internal
