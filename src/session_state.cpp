#include "vocab/session_state.hpp"

namespace vocab {

std::optional<SessionState> MemorySessionStateStore::load(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<SessionState> MemorySessionStateStore::find_for_user(
    const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : sessions_) {
    if (entry.second.user_id == user_id) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void MemorySessionStateStore::save(const SessionState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[state.session_id] = state;
}

void MemorySessionStateStore::erase(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.erase(session_id);
}

std::size_t MemorySessionStateStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace vocab
