#include "transfer_server.hpp"

#include <array>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {

using tcp = asio::ip::tcp;

// One inbound connection: request, size token, ACK, chunks.
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
  TransferSession(tcp::socket socket,
                  const AuthState& auth,
                  const TransferServer::Options& options,
                  std::shared_ptr<TransferServer::Counters> counters,
                  std::shared_ptr<Logger> logger)
    : socket_(std::move(socket)),
      timer_(socket_.get_executor()),
      auth_(auth),
      workspace_root_(options.workspace_root),
      read_timeout_(options.read_timeout),
      transfer_debug_(options.transfer_debug),
      counters_(std::move(counters)),
      logger_(std::move(logger)) {
    std::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("?") : endpoint_to_string(remote);
  }

  void start() {
    read_request();
  }

private:
  void arm_timer() {
    const auto generation = ++timer_generation_;
    timer_.expires_after(read_timeout_);
    auto self = shared_from_this();
    timer_.async_wait([this, self, generation](const std::error_code& ec){
      if(ec || generation != timer_generation_ || closed_) return;
      counters_->timed_out.fetch_add(1);
      logger_->warn("Transfer connection from {} timed out after {} ms", peer_, read_timeout_.count());
      close();
    });
  }

  void disarm_timer() {
    ++timer_generation_;
    timer_.cancel();
  }

  void read_request() {
    arm_timer();
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(read_buf_),
      [this, self](std::error_code ec, std::size_t n){
        if(closed_) return;
        if(ec) {
          logger_->debug("Transfer request read from {} failed: {}", peer_, ec.message());
          close();
          return;
        }
        request_buf_.append(read_buf_.data(), n);
        std::string error;
        auto request = decode_transfer_request(request_buf_, error);
        if(!request) {
          if(!error.empty()) {
            reject(fmt::format("bad request ({})", error));
            return;
          }
          read_request();
          return;
        }
        disarm_timer();
        handle_request(*request);
      });
  }

  void handle_request(const TransferRequest& request) {
    auto state = auth_.snapshot();
    if(!state.authenticated) {
      reject(fmt::format("{} asked for {} while no user is signed in", request.username, request.filename));
      return;
    }
    if(!is_plain_filename(request.filename)) {
      reject(fmt::format("{} asked for invalid name '{}'", request.username, request.filename));
      return;
    }

    path_ = workspace_root_ / state.username / request.filename;
    std::error_code ec;
    if(!std::filesystem::is_regular_file(path_, ec)) {
      reject(fmt::format("{} asked for {} which {} does not have", request.username, request.filename, state.username));
      return;
    }
    size_ = std::filesystem::file_size(path_, ec);
    if(ec) {
      reject(fmt::format("cannot stat {}: {}", path_.string(), ec.message()));
      return;
    }
    file_.open(path_, std::ios::binary);
    if(!file_) {
      reject(fmt::format("cannot open {}", path_.string()));
      return;
    }

    requester_ = request.username;
    logger_->info("Serving {} ({} bytes) to {} at {}", request.filename, size_, requester_, peer_);
    send_size_token();
  }

  void send_size_token() {
    token_ = encode_size_token(size_);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(token_),
      [this, self](std::error_code ec, std::size_t){
        if(closed_) return;
        if(ec) {
          logger_->warn("Sending size to {} failed: {}", peer_, ec.message());
          close();
          return;
        }
        await_ack();
      });
  }

  void await_ack() {
    arm_timer();
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(ack_buf_),
      [this, self](std::error_code ec, std::size_t){
        if(closed_) return;
        disarm_timer();
        if(ec) {
          logger_->warn("No acknowledgment from {}: {}", peer_, ec.message());
          close();
          return;
        }
        if(std::string(ack_buf_.data(), ack_buf_.size()) != kTransferAck) {
          logger_->warn("Unexpected acknowledgment from {}", peer_);
          close();
          return;
        }
        send_next_chunk();
      });
  }

  void send_next_chunk() {
    file_.read(chunk_.data(), static_cast<std::streamsize>(chunk_.size()));
    const auto got = static_cast<std::size_t>(file_.gcount());
    if(got == 0) {
      finish();
      return;
    }
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(chunk_.data(), got),
      [this, self](std::error_code ec, std::size_t written){
        if(closed_) return;
        if(ec) {
          logger_->warn("Sending {} to {} failed after {} bytes: {}",
                        path_.filename().string(), peer_, sent_, ec.message());
          close();
          return;
        }
        sent_ += written;
        counters_->chunks_sent.fetch_add(1);
        counters_->bytes_sent.fetch_add(written);
        send_next_chunk();
      });
  }

  void finish() {
    if(sent_ != size_) {
      logger_->warn("{} changed while being served: sent {} of {} bytes", path_.string(), sent_, size_);
    }
    counters_->served.fetch_add(1);
    logger_->info("Sent {} ({} bytes) to {}", path_.filename().string(), sent_, requester_);
    if(transfer_debug_) {
      logger_->info("sha256 {} = {}", path_.filename().string(),
                     sha256_file_hex(path_).value_or("<unreadable>"));
    }
    std::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    close();
  }

  void reject(const std::string& reason) {
    counters_->rejected.fetch_add(1);
    logger_->info("Closing transfer connection from {}: {}", peer_, reason);
    close();
  }

  void close() {
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    timer_.cancel();
    socket_.close(ec);
  }

  tcp::socket socket_;
  asio::steady_timer timer_;
  const AuthState& auth_;
  std::filesystem::path workspace_root_;
  std::chrono::milliseconds read_timeout_;
  bool transfer_debug_;
  std::shared_ptr<TransferServer::Counters> counters_;
  std::shared_ptr<Logger> logger_;

  std::string peer_;
  std::string requester_;
  std::array<char, kMaxTransferRequestBytes> read_buf_{};
  std::string request_buf_;
  std::string token_;
  std::array<char, kTransferAckSize> ack_buf_{};
  std::array<char, kTransferChunkSize> chunk_{};
  std::filesystem::path path_;
  std::ifstream file_;
  uint64_t size_ = 0;
  uint64_t sent_ = 0;
  uint64_t timer_generation_ = 0;
  bool closed_ = false;
};

} // namespace

TransferServer::TransferServer(const AuthState& auth,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : auth_(auth),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")),
    counters_(std::make_shared<Counters>()) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(options_.read_timeout.count() <= 0) {
    options_.read_timeout = std::chrono::milliseconds(5000);
  }
}

TransferServer::~TransferServer() {
  stop();
}

void TransferServer::start() {
  if(started_) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.bind_ip);
  } catch(const std::exception& e) {
    throw ConfigError("Invalid transfer_ip '" + options_.bind_ip + "': " + e.what());
  }

  tcp::endpoint endpoint(listen_address, options_.port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  std::error_code ec;
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    acceptor_.reset();
    throw ConfigError("Cannot listen for transfers on " + endpoint_to_string(endpoint) +
                      ": " + ec.message());
  }
  bound_port_ = acceptor_->local_endpoint().port();
  started_ = true;
  logger_->info("Transfer listener on {}:{}", options_.bind_ip, bound_port_);

  start_accept();
}

void TransferServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->error("Accept error: {}", ec.message());
      } else {
        counters_->accepted.fetch_add(1);
        std::error_code rec;
        auto remote = socket.remote_endpoint(rec);
        logger_->debug("Accepted transfer connection from {}",
                       rec ? std::string("?") : endpoint_to_string(remote));
        try {
          std::make_shared<TransferSession>(std::move(socket), auth_, options_, counters_, logger_)->start();
        } catch(const std::exception& e) {
          logger_->error("Transfer handler failed to start: {}", e.what());
        }
      }
      if(started_) {
        start_accept();
      }
    });
}

void TransferServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    try {
      io_.run();
    } catch(const std::exception& e) {
      logger_->error("Transfer I/O thread stopped: {}", e.what());
    }
  });
}

void TransferServer::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();
  io_.restart();
  logger_->debug("Transfer listener stopped");
}

TransferServer::Stats TransferServer::stats() const {
  Stats s;
  s.accepted = counters_->accepted.load();
  s.served = counters_->served.load();
  s.rejected = counters_->rejected.load();
  s.timed_out = counters_->timed_out.load();
  s.chunks_sent = counters_->chunks_sent.load();
  s.bytes_sent = counters_->bytes_sent.load();
  return s;
}
