#include "execbridge/internal/clock.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace execbridge::internal {

namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

class SteadyClock final : public Clock {
 public:
  time_point now() override { return std::chrono::steady_clock::now(); }

  void sleep_for(milliseconds duration) override { std::this_thread::sleep_for(duration); }
};

std::atomic<Clock*> g_clock_override{nullptr};

}  // namespace

Deadline::Deadline(Clock& clock, milliseconds budget) : clock_(clock), at_(clock.now() + budget) {}

bool Deadline::expired() const { return clock_.now() >= at_; }

milliseconds Deadline::remaining() const {
  auto left = duration_cast<milliseconds>(at_ - clock_.now());
  return std::max(left, milliseconds(0));
}

void Deadline::sleep_step(milliseconds step) const {
  auto left = remaining();
  if (left > milliseconds(0)) {
    clock_.sleep_for(std::min(step, left));
  }
}

milliseconds elapsed_since(Clock& clock, Clock::time_point since) {
  auto elapsed = duration_cast<milliseconds>(clock.now() - since);
  return std::max(elapsed, milliseconds(0));
}

ScopedClockOverride::ScopedClockOverride(Clock& clock)
    : previous_(g_clock_override.exchange(&clock)) {}

ScopedClockOverride::~ScopedClockOverride() { g_clock_override.store(previous_); }

Clock& default_clock() {
  if (auto* override_clock = g_clock_override.load()) {
    return *override_clock;
  }
  static SteadyClock clock;
  return clock;
}

}  // namespace execbridge::internal
