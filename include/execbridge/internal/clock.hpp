#pragma once

#include <chrono>

namespace execbridge::internal {

/// Time source for grace windows, activity stamps and idle eviction.
class Clock {
 public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// Fixed end of a bounded wait (the execute grace window, the SIGTERM grace).
class Deadline {
 public:
  Deadline(Clock& clock, std::chrono::milliseconds budget);

  [[nodiscard]] bool expired() const;
  [[nodiscard]] std::chrono::milliseconds remaining() const;
  /// Sleeps for step, or only until the deadline if that comes first.
  void sleep_step(std::chrono::milliseconds step) const;

 private:
  Clock& clock_;
  Clock::time_point at_;
};

/// Whole milliseconds since `since`; zero if `since` lies in the future.
std::chrono::milliseconds elapsed_since(Clock& clock, Clock::time_point since);

class ScopedClockOverride {
 public:
  explicit ScopedClockOverride(Clock& clock);
  ~ScopedClockOverride();
  ScopedClockOverride(const ScopedClockOverride&) = delete;
  ScopedClockOverride& operator=(const ScopedClockOverride&) = delete;

 private:
  Clock* previous_ = nullptr;
};

Clock& default_clock();

}  // namespace execbridge::internal
