#include "transfer_client.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;

struct StepResult {
  std::error_code ec;
  std::size_t bytes = 0;
  bool timed_out = false;
};

// Runs one async operation on io with a deadline; cancels it when the
// deadline passes so the socket stays usable for another read.
template<typename StartOp>
StepResult run_step(asio::io_context& io,
                    tcp::socket& socket,
                    std::chrono::milliseconds timeout,
                    StartOp start) {
  StepResult result;
  bool done = false;
  start([&](std::error_code ec, std::size_t bytes){
    result.ec = ec;
    result.bytes = bytes;
    done = true;
  });
  io.restart();
  io.run_for(timeout);
  if(!done) {
    result.timed_out = true;
    std::error_code ignored;
    socket.cancel(ignored);
    io.restart();
    io.run();
  }
  return result;
}

TransferOutcome fail(TransferOutcome outcome, TransferError error, std::string detail) {
  outcome.error = error;
  outcome.detail = std::move(detail);
  return outcome;
}

} // namespace

TransferOutcome fetch_file(const FetchTarget& target,
                           const std::string& requester,
                           const std::string& filename,
                           const std::filesystem::path& dest_dir,
                           const TransferConfig& config,
                           Logger* logger) {
  Logger fallback("transfer");
  Logger& log = logger ? *logger : fallback;

  TransferOutcome outcome;
  if(!is_plain_filename(filename)) {
    return fail(outcome, TransferError::NotFound, "invalid filename '" + filename + "'");
  }
  outcome.path = dest_dir / filename;

  asio::ip::address address;
  std::error_code ec;
  address = asio::ip::make_address(target.address, ec);
  if(ec) {
    return fail(outcome, TransferError::ConnectFailed, "invalid address '" + target.address + "'");
  }
  const tcp::endpoint endpoint(address, target.port);

  asio::io_context io;
  tcp::socket socket(io);

  log.info("Connecting to {} at {} for {}", target.username, endpoint_to_string(endpoint), filename);
  auto connected = run_step(io, socket, config.connect_timeout, [&](auto handler){
    socket.async_connect(endpoint, [handler](std::error_code e) mutable { handler(e, 0); });
  });
  if(connected.timed_out) {
    return fail(outcome, TransferError::ConnectTimeout,
                fmt::format("no connection to {} within {} ms",
                            endpoint_to_string(endpoint), config.connect_timeout.count()));
  }
  if(connected.ec == asio::error::connection_refused) {
    return fail(outcome, TransferError::ConnectionRefused, connected.ec.message());
  }
  if(connected.ec) {
    return fail(outcome, TransferError::ConnectFailed, connected.ec.message());
  }

  TransferRequest request;
  request.username = requester;
  request.filename = filename;
  const std::string request_wire = encode_transfer_request(request);
  asio::write(socket, asio::buffer(request_wire), ec);
  if(ec) {
    return fail(outcome, TransferError::ConnectFailed, "sending request: " + ec.message());
  }

  // Size token: up to the newline. A sender that leaves it unterminated is
  // accepted once the digits stop arriving for token_idle_timeout.
  std::array<char, 64> token_buf{};
  std::string token;
  std::string leftover;
  for(;;) {
    const bool partial = !token.empty();
    const auto wait = partial ? std::min(config.token_idle_timeout, config.read_timeout) : config.read_timeout;
    auto step = run_step(io, socket, wait, [&](auto handler){
      socket.async_read_some(asio::buffer(token_buf), handler);
    });
    if(step.timed_out) {
      if(partial) break;
      return fail(outcome, TransferError::Timeout, "waiting for file size");
    }
    if(step.ec == asio::error::eof && token.empty()) {
      return fail(outcome, TransferError::NotFound,
                  fmt::format("{} closed the connection without sending {}", target.username, filename));
    }
    if(step.ec && step.ec != asio::error::eof) {
      return fail(outcome, TransferError::Truncated, "reading file size: " + step.ec.message());
    }
    token.append(token_buf.data(), step.bytes);
    const auto newline = token.find('\n');
    if(newline != std::string::npos) {
      leftover = token.substr(newline + 1);
      token.resize(newline);
      break;
    }
    if(step.ec == asio::error::eof || !is_partial_size_token(token)) break;
  }

  auto size = decode_size_token(token);
  if(!size) {
    return fail(outcome, TransferError::BadSizeToken, "received '" + trim_copy(token) + "'");
  }
  outcome.expected_bytes = *size;

  std::filesystem::create_directories(dest_dir, ec);
  std::ofstream out(outcome.path, std::ios::binary | std::ios::trunc);
  if(!out) {
    return fail(outcome, TransferError::LocalWriteFailed, "cannot open " + outcome.path.string());
  }
  auto discard_partial = [&](){
    out.close();
    std::error_code ignored;
    std::filesystem::remove(outcome.path, ignored);
  };

  asio::write(socket, asio::buffer(kTransferAck, kTransferAckSize), ec);
  if(ec) {
    discard_partial();
    return fail(outcome, TransferError::Truncated, "sending acknowledgment: " + ec.message());
  }

  if(!leftover.empty()) {
    const auto take = std::min<uint64_t>(leftover.size(), outcome.expected_bytes);
    out.write(leftover.data(), static_cast<std::streamsize>(take));
    outcome.received_bytes += take;
  }
  if(config.progress) config.progress(outcome.received_bytes, outcome.expected_bytes);

  std::array<char, kTransferChunkSize> chunk{};
  while(outcome.received_bytes < outcome.expected_bytes) {
    const auto want = static_cast<std::size_t>(
      std::min<uint64_t>(chunk.size(), outcome.expected_bytes - outcome.received_bytes));
    auto step = run_step(io, socket, config.read_timeout, [&](auto handler){
      asio::async_read(socket, asio::buffer(chunk.data(), want), handler);
    });
    if(step.bytes > 0) {
      out.write(chunk.data(), static_cast<std::streamsize>(step.bytes));
      outcome.received_bytes += step.bytes;
      ++outcome.chunks;
      if(config.progress) config.progress(outcome.received_bytes, outcome.expected_bytes);
    }
    if(step.timed_out) {
      discard_partial();
      return fail(outcome, TransferError::Timeout,
                  fmt::format("stalled after {} of {} bytes", outcome.received_bytes, outcome.expected_bytes));
    }
    if(step.ec) {
      discard_partial();
      return fail(outcome, TransferError::Truncated,
                  fmt::format("received {} of {} bytes", outcome.received_bytes, outcome.expected_bytes));
    }
    if(!out) {
      discard_partial();
      return fail(outcome, TransferError::LocalWriteFailed, "writing " + outcome.path.string());
    }
  }

  out.close();
  if(!out) {
    discard_partial();
    return fail(outcome, TransferError::LocalWriteFailed, "closing " + outcome.path.string());
  }
  socket.close(ec);

  log.info("Received {} ({} bytes, {} chunks) from {}",
           filename, outcome.received_bytes, outcome.chunks, target.username);
  if(config.transfer_debug) {
    log.info("sha256 {} = {}", filename, sha256_file_hex(outcome.path).value_or("<unreadable>"));
  }
  return outcome;
}
