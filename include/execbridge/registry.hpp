#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "execbridge/internal/clock.hpp"
#include "execbridge/session.hpp"

namespace execbridge {

/// @brief Table of live interactive sessions keyed by id.
///
/// One mutex guards the map and is never held while a session is closed, so a slow
/// close cannot stall lookups of other sessions. Sessions removed by any of the
/// remove_* calls are closed by the registry after the lock is released.
class SessionRegistry {
 public:
  SessionRegistry() = default;
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;
  /// @brief Closes every remaining session.
  ~SessionRegistry();

  /// @brief Add a session under its id.
  void insert(std::shared_ptr<Session> session);

  /// @brief Look up a session; nullptr if unknown.
  [[nodiscard]] std::shared_ptr<Session> find(std::string_view id) const;

  /// @brief Remove and close one session. Returns false if the id was unknown.
  bool close(std::string_view id);

  /// @brief Remove and close sessions idle for longer than timeout as of now.
  ///
  /// @return Ids of the sessions that were evicted.
  std::vector<std::string> close_idle(internal::Clock::time_point now,
                                      std::chrono::milliseconds timeout);

  /// @brief Remove and close every session.
  std::size_t close_all();

  /// @brief Number of registered sessions.
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions_;
};

}  // namespace execbridge
