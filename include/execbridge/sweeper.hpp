#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "execbridge/registry.hpp"
#include "execbridge/result.hpp"

namespace execbridge {

/// @brief Background thread that closes sessions nobody has polled for a while.
class IdleSweeper {
 public:
  /// @brief Sweep registry every interval, evicting sessions idle longer than idle_timeout.
  IdleSweeper(SessionRegistry& registry, std::chrono::milliseconds idle_timeout,
              std::chrono::milliseconds interval);
  IdleSweeper(const IdleSweeper&) = delete;
  IdleSweeper& operator=(const IdleSweeper&) = delete;
  /// @brief Calls stop().
  ~IdleSweeper();

  /// @brief Launch the thread. No-op if already running.
  Result<void> start();
  /// @brief Wake and join the thread. Returns promptly; idempotent.
  void stop() noexcept;

  /// @brief One synchronous pass; returns how many sessions were evicted.
  std::size_t sweep_once();

 private:
  void run();

  SessionRegistry& registry_;
  std::chrono::milliseconds idle_timeout_;
  std::chrono::milliseconds interval_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::thread thread_;
};

}  // namespace execbridge
