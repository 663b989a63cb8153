#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "auth_state.hpp"
#include "log.hpp"

// Serves files from the signed-in user's directory to other peers. The
// acceptor and every connection handler run as async operations on one
// I/O thread; accepting never waits for a handler.
class TransferServer {
public:
  struct Options {
    std::string bind_ip = "127.0.0.1";
    uint16_t port = 0;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Bounds the wait for the request and for the ACK.
    std::chrono::milliseconds read_timeout{5000};
    bool transfer_debug = false;
  };

  struct Counters {
    std::atomic<std::size_t> accepted{0};
    std::atomic<std::size_t> served{0};
    std::atomic<std::size_t> rejected{0};
    std::atomic<std::size_t> timed_out{0};
    std::atomic<std::size_t> chunks_sent{0};
    std::atomic<uint64_t> bytes_sent{0};
  };

  struct Stats {
    std::size_t accepted = 0;
    std::size_t served = 0;
    std::size_t rejected = 0;
    std::size_t timed_out = 0;
    std::size_t chunks_sent = 0;
    uint64_t bytes_sent = 0;
  };

  TransferServer(const AuthState& auth,
                 Options options,
                 std::shared_ptr<Logger> logger = nullptr);
  ~TransferServer();

  TransferServer(const TransferServer&) = delete;
  TransferServer& operator=(const TransferServer&) = delete;

  void start();
  void start_background();
  void stop();

  uint16_t bound_port() const { return bound_port_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  Stats stats() const;

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  const AuthState& auth_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Counters> counters_;
  asio::io_context io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::thread io_thread_;
  uint16_t bound_port_ = 0;
  std::atomic<bool> started_{false};
};
