#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Session {
  std::string username;
  asio::ip::udp::endpoint endpoint;
  std::chrono::steady_clock::time_point last_heartbeat{};
  uint16_t transfer_port = 0;
};

// Online peers keyed by username. A session stays live until sweep() finds
// its heartbeat age past the liveness window.
class SessionTable {
public:
  using Clock = std::chrono::steady_clock;

  explicit SessionTable(Clock::duration liveness_window);

  const Session* find(const std::string& username) const;
  bool is_live(const std::string& username) const {
    return find(username) != nullptr;
  }

  // Fails when a session for the same username exists.
  bool open(Session session, Clock::time_point now);
  // Updates timestamp and endpoint of an existing session; false otherwise.
  bool refresh(const std::string& username,
               const asio::ip::udp::endpoint& endpoint,
               Clock::time_point now);

  std::vector<std::string> live_usernames() const;

  // Removes every expired session and returns the evicted usernames.
  std::vector<std::string> sweep(Clock::time_point now);

  Clock::duration liveness_window() const { return liveness_window_; }
  std::size_t size() const { return sessions_.size(); }

private:
  bool expired(const Session& session, Clock::time_point now) const {
    return now - session.last_heartbeat > liveness_window_;
  }

  Clock::duration liveness_window_;
  std::map<std::string, Session> sessions_;
};
