#pragma once

#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Blocking request/reply over the control channel. One request in flight at
// a time; calls from several threads are serialized.
class ControlClient {
public:
  static constexpr std::chrono::milliseconds kDefaultReplyTimeout{5000};

  ControlClient(const std::string& server_ip,
                uint16_t server_port,
                std::chrono::milliseconds reply_timeout = kDefaultReplyTimeout,
                std::shared_ptr<Logger> logger = nullptr);

  ControlClient(const ControlClient&) = delete;
  ControlClient& operator=(const ControlClient&) = delete;

  // Sends the request and waits for the coordinator's reply. nullopt on
  // timeout or socket failure.
  std::optional<std::string> request(const nlohmann::json& message);
  // Fire-and-forget; false when the datagram could not be sent.
  bool send(const nlohmann::json& message);

  const asio::ip::udp::endpoint& server_endpoint() const { return server_; }
  std::chrono::milliseconds reply_timeout() const { return reply_timeout_; }

private:
  using udp = asio::ip::udp;

  void drain_stale_replies();

  std::mutex mutex_;
  asio::io_context io_;
  udp::socket socket_;
  udp::endpoint server_;
  std::chrono::milliseconds reply_timeout_;
  std::shared_ptr<Logger> logger_;
  std::array<char, 65536> buffer_{};
};
