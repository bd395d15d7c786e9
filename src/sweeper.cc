#include "execbridge/sweeper.hpp"

#include <system_error>

#include "execbridge/internal/clock.hpp"
#include "execbridge/log.hpp"

namespace execbridge {

IdleSweeper::IdleSweeper(SessionRegistry& registry, std::chrono::milliseconds idle_timeout,
                         std::chrono::milliseconds interval)
    : registry_(registry), idle_timeout_(idle_timeout), interval_(interval) {}

IdleSweeper::~IdleSweeper() { stop(); }

Result<void> IdleSweeper::start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) {
    return {};
  }
  stop_requested_ = false;
  try {
    thread_ = std::thread(&IdleSweeper::run, this);
  } catch (const std::system_error& ex) {
    return std::unexpected(Error{ex.code(), "start idle sweeper"});
  }
  return {};
}

void IdleSweeper::stop() noexcept {
  std::thread thread;
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
    thread = std::move(thread_);
  }
  cv_.notify_all();
  if (thread.joinable()) {
    thread.join();
  }
}

std::size_t IdleSweeper::sweep_once() {
  auto evicted = registry_.close_idle(internal::default_clock().now(), idle_timeout_);
  for (const auto& id : evicted) {
    logger()->info("session {}: idle for more than {} ms, closed", id, idle_timeout_.count());
  }
  return evicted.size();
}

void IdleSweeper::run() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    sweep_once();
    lock.lock();
  }
}

}  // namespace execbridge
