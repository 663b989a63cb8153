#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auth_state.hpp"
#include "control_client.hpp"
#include "errors.hpp"
#include "heartbeat_loop.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transfer_client.hpp"
#include "transfer_server.hpp"

struct AuthOutcome {
  AuthError error = AuthError::None;
  std::string reply;

  bool ok() const { return error == AuthError::None; }
};

struct ControlReply {
  enum class Status {
    Ok,
    Failed,
    Timeout,
    NotAuthenticated,
    Unexpected
  };

  Status status = Status::Ok;
  std::vector<std::string> items;
  // Raw coordinator text, or the local reason when nothing was sent.
  std::string message;

  bool ok() const { return status == Status::Ok; }
};

struct FetchOutcome {
  ControlReply lookup;
  std::optional<FetchTarget> target;
  TransferOutcome transfer;

  bool ok() const { return lookup.ok() && target && transfer.ok(); }
};

// One participant: control-channel client to the coordinator and transfer
// server to other peers. Operations are called from the command unit.
class PeerAgent {
public:
  struct Options {
    std::string server_ip = "127.0.0.1";
    uint16_t server_port = 0;
    std::string transfer_ip = "127.0.0.1";
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::chrono::milliseconds heartbeat_interval{2000};
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds transfer_read_timeout{5000};
    bool transfer_debug = false;
  };

  explicit PeerAgent(Options options);
  ~PeerAgent();

  PeerAgent(const PeerAgent&) = delete;
  PeerAgent& operator=(const PeerAgent&) = delete;

  // Opens the transfer listener. Must precede authenticate().
  void start();
  // Signs out, then stops and joins every background unit.
  void stop();

  AuthOutcome authenticate(const std::string& username, const std::string& password);
  void sign_out();

  ControlReply list_peers();
  ControlReply list_files();
  ControlReply share(const std::string& filename);
  ControlReply search(const std::string& pattern);
  ControlReply remove(const std::string& filename);
  FetchOutcome fetch(const std::string& filename, TransferProgress progress = {});

  AuthState::Snapshot auth_snapshot() const { return auth_.snapshot(); }
  uint16_t transfer_port() const { return transfer_.bound_port(); }
  std::filesystem::path user_directory() const;
  TransferServer::Stats transfer_stats() const { return transfer_.stats(); }
  std::size_t heartbeats_sent() const { return heartbeat_.beats_sent(); }
  bool heartbeat_running() const { return heartbeat_.running(); }

  void add_log_listener(const Logger::Listener& listener);
  void clear_log_listeners();
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  ControlReply listing(MessageType type, ListingKind kind, const std::string& pattern = {});
  std::optional<AuthState::Snapshot> signed_in(ControlReply& reply) const;
  bool ensure_user_directory(const std::string& username) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Logger> control_logger_;
  std::shared_ptr<Logger> heartbeat_logger_;
  std::shared_ptr<Logger> transfer_logger_;

  AuthState auth_;
  ControlClient control_;
  HeartbeatLoop heartbeat_;
  TransferServer transfer_;
  bool started_ = false;
};

const char* to_string(ControlReply::Status status);
