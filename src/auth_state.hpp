#pragma once

#include <mutex>
#include <string>
#include <utility>

// Who is signed in on this agent. Written by the command unit, read by the
// heartbeat loop and transfer handlers.
class AuthState {
public:
  struct Snapshot {
    std::string username;
    bool authenticated = false;
  };

  void sign_in(std::string username) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.username = std::move(username);
    state_.authenticated = true;
  }

  void sign_out() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.authenticated = false;
  }

  Snapshot snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  bool authenticated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.authenticated;
  }

private:
  mutable std::mutex mutex_;
  Snapshot state_;
};
