#include "execbridge/internal/wait_policy.hpp"

namespace execbridge::internal {

Result<ExitStatus> terminate_and_reap(WaitOps& ops, Clock& clock,
                                      std::chrono::milliseconds kill_grace) {
  constexpr auto kSleepStep = std::chrono::milliseconds(1);

  auto term_result = ops.terminate();
  if (!term_result) {
    return std::unexpected(term_result.error());
  }

  Deadline grace(clock, kill_grace);
  while (!grace.expired()) {
    auto wait_result = ops.try_wait();
    if (!wait_result) {
      return std::unexpected(wait_result.error());
    }
    if (wait_result->has_value()) {
      return **wait_result;
    }
    grace.sleep_step(kSleepStep);
  }

  auto kill_result = ops.kill();
  if (!kill_result) {
    return std::unexpected(kill_result.error());
  }
  return ops.wait_blocking();
}

bool wait_until(Clock& clock, std::chrono::milliseconds timeout, std::chrono::milliseconds step,
                const std::function<bool()>& done) {
  Deadline deadline(clock, timeout);
  while (!done()) {
    if (deadline.expired()) {
      return done();
    }
    deadline.sleep_step(step);
  }
  return true;
}

}  // namespace execbridge::internal
