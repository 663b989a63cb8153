#include "session_table.hpp"

SessionTable::SessionTable(Clock::duration liveness_window)
  : liveness_window_(liveness_window) {}

const Session* SessionTable::find(const std::string& username) const {
  auto it = sessions_.find(username);
  if(it == sessions_.end()) return nullptr;
  return &it->second;
}

bool SessionTable::open(Session session, Clock::time_point now) {
  if(is_live(session.username)) return false;
  session.last_heartbeat = now;
  auto key = session.username;
  sessions_[key] = std::move(session);
  return true;
}

bool SessionTable::refresh(const std::string& username,
                           const asio::ip::udp::endpoint& endpoint,
                           Clock::time_point now) {
  auto it = sessions_.find(username);
  if(it == sessions_.end()) return false;
  it->second.endpoint = endpoint;
  it->second.last_heartbeat = now;
  return true;
}

std::vector<std::string> SessionTable::live_usernames() const {
  std::vector<std::string> out;
  for(const auto& entry : sessions_) {
    out.push_back(entry.first);
  }
  return out;
}

std::vector<std::string> SessionTable::sweep(Clock::time_point now) {
  std::vector<std::string> evicted;
  for(auto it = sessions_.begin(); it != sessions_.end();) {
    if(expired(it->second, now)) {
      evicted.push_back(it->first);
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}
