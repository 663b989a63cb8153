#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "auth_state.hpp"
#include "log.hpp"

// Sends STATUS to the coordinator every interval while the agent is signed
// in. Uses its own socket so it never competes with ControlClient for replies.
class HeartbeatLoop {
public:
  static constexpr std::chrono::milliseconds kDefaultInterval{2000};

  HeartbeatLoop(const AuthState& auth,
                asio::ip::udp::endpoint coordinator,
                std::chrono::milliseconds interval = kDefaultInterval,
                std::shared_ptr<Logger> logger = nullptr);
  ~HeartbeatLoop();

  HeartbeatLoop(const HeartbeatLoop&) = delete;
  HeartbeatLoop& operator=(const HeartbeatLoop&) = delete;

  // Sends the first heartbeat immediately.
  void start();
  void stop();

  bool running() const;
  std::size_t beats_sent() const;

private:
  void run();
  bool beat();

  const AuthState& auth_;
  asio::ip::udp::endpoint coordinator_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  asio::ip::udp::socket socket_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool running_ = false;
  std::size_t beats_sent_ = 0;
  std::thread thread_;
};
