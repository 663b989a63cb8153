#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "credential_store.hpp"
#include "errors.hpp"
#include "file_index.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "session_table.hpp"

// The coordination authority: credentials, sessions and the file index.
// Not thread safe. CoordinatorServer feeds it one datagram at a time, which
// is what serializes every mutation.
class Coordinator {
public:
  using Clock = SessionTable::Clock;
  static constexpr std::chrono::seconds kDefaultLivenessWindow{3};

  Coordinator(CredentialStore credentials,
              Clock::duration liveness_window = kDefaultLivenessWindow,
              std::shared_ptr<Logger> logger = nullptr);

  // Handles one control datagram and runs the expiry sweep afterwards.
  // Returns the reply payload, or nullopt when nothing is sent back
  // (heartbeats, unknown message types).
  std::optional<std::string> process(const std::string& payload,
                                     const asio::ip::udp::endpoint& source,
                                     Clock::time_point now);

  AuthError authenticate(const std::string& username,
                         const std::string& password,
                         uint16_t transfer_port,
                         const asio::ip::udp::endpoint& source,
                         Clock::time_point now);
  void heartbeat(const std::string& username,
                 const asio::ip::udp::endpoint& source,
                 Clock::time_point now);
  std::vector<std::string> list_peers(const std::string& username) const;
  std::vector<std::string> list_files(const std::string& username) const;
  void share(const std::string& username, const std::string& filename);
  std::vector<std::string> search(const std::string& username,
                                  const std::string& pattern) const;
  bool remove(const std::string& username, const std::string& filename);
  std::optional<FetchTarget> fetch(const std::string& username,
                                   const std::string& filename) const;
  std::vector<std::string> sweep(Clock::time_point now);

  const SessionTable& sessions() const { return sessions_; }
  const FileIndex& files() const { return files_; }
  const CredentialStore& credentials() const { return credentials_; }

private:
  std::optional<std::string> dispatch(const ControlRequest& request,
                                      const asio::ip::udp::endpoint& source,
                                      Clock::time_point now);
  FileIndex::SharerFilter live_sharer_other_than(const std::string& username) const;

  CredentialStore credentials_;
  SessionTable sessions_;
  FileIndex files_;
  std::shared_ptr<Logger> logger_;
};
