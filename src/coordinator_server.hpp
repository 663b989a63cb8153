#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "coordinator.hpp"
#include "log.hpp"

// Binds the control socket and feeds each datagram to the Coordinator.
// Receive, handle, reply and the next receive all happen on one I/O thread.
class CoordinatorServer {
public:
  struct Options {
    std::string bind_ip = "127.0.0.1";
    uint16_t port = 0;
  };

  static constexpr std::size_t kMaxDatagramSize = 65507;

  CoordinatorServer(Coordinator& coordinator,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~CoordinatorServer();

  CoordinatorServer(const CoordinatorServer&) = delete;
  CoordinatorServer& operator=(const CoordinatorServer&) = delete;

  void start();
  void run();
  void start_background();
  void stop();

  // Valid after start(); resolves a requested port of 0.
  uint16_t bound_port() const { return bound_port_; }
  std::size_t datagrams_handled() const { return datagrams_handled_.load(); }

private:
  using udp = asio::ip::udp;

  void do_receive();
  void handle_datagram(std::size_t length);

  Coordinator& coordinator_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<udp::socket> socket_;
  std::thread io_thread_;
  udp::endpoint remote_;
  std::array<char, kMaxDatagramSize> buffer_{};
  uint16_t bound_port_ = 0;
  std::atomic<bool> started_{false};
  std::atomic<std::size_t> datagrams_handled_{0};
};
