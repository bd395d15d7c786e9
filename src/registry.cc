#include "execbridge/registry.hpp"

#include <utility>

#include "execbridge/log.hpp"

namespace execbridge {

SessionRegistry::~SessionRegistry() { close_all(); }

void SessionRegistry::insert(std::shared_ptr<Session> session) {
  auto id = session->id();
  std::lock_guard lock(mutex_);
  sessions_.insert_or_assign(std::move(id), std::move(session));
}

std::shared_ptr<Session> SessionRegistry::find(std::string_view id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::close(std::string_view id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return false;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  session->close();
  return true;
}

std::vector<std::string> SessionRegistry::close_idle(internal::Clock::time_point now,
                                                     std::chrono::milliseconds timeout) {
  std::vector<std::shared_ptr<Session>> idle;
  {
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second->last_activity() > timeout) {
        idle.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  std::vector<std::string> ids;
  ids.reserve(idle.size());
  for (auto& session : idle) {
    session->close();
    ids.push_back(session->id());
  }
  return ids;
}

std::size_t SessionRegistry::close_all() {
  std::map<std::string, std::shared_ptr<Session>, std::less<>> drained;
  {
    std::lock_guard lock(mutex_);
    drained.swap(sessions_);
  }
  for (auto& [id, session] : drained) {
    session->close();
  }
  if (!drained.empty()) {
    logger()->debug("closed {} remaining session(s)", drained.size());
  }
  return drained.size();
}

std::size_t SessionRegistry::size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

}  // namespace execbridge
