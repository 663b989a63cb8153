#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Called after each chunk lands with the bytes received so far and the
// announced size.
using TransferProgress = std::function<void(uint64_t received, uint64_t expected)>;

struct TransferConfig {
  std::chrono::milliseconds connect_timeout{10000};
  // Applies to every read: size token and each chunk.
  std::chrono::milliseconds read_timeout{10000};
  // Quiet period that ends a size token sent without its newline.
  std::chrono::milliseconds token_idle_timeout{200};
  bool transfer_debug = false;
  TransferProgress progress;
};

struct TransferOutcome {
  TransferError error = TransferError::None;
  uint64_t expected_bytes = 0;
  uint64_t received_bytes = 0;
  std::size_t chunks = 0;
  std::filesystem::path path;
  std::string detail;

  bool ok() const { return error == TransferError::None; }
};

// Downloads filename from the sharer named by target into
// dest_dir/filename. A partially received file is deleted.
TransferOutcome fetch_file(const FetchTarget& target,
                           const std::string& requester,
                           const std::string& filename,
                           const std::filesystem::path& dest_dir,
                           const TransferConfig& config = {},
                           Logger* logger = nullptr);
