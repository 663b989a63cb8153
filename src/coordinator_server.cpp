#include "coordinator_server.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

CoordinatorServer::CoordinatorServer(Coordinator& coordinator,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : coordinator_(coordinator),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")) {}

CoordinatorServer::~CoordinatorServer() {
  stop();
}

void CoordinatorServer::start() {
  if(started_) return;

  asio::ip::address bind_address;
  try {
    bind_address = asio::ip::make_address(options_.bind_ip);
  } catch(const std::exception& e) {
    throw ConfigError("Invalid bind_ip '" + options_.bind_ip + "': " + e.what());
  }

  udp::endpoint endpoint(bind_address, options_.port);
  socket_ = std::make_unique<udp::socket>(io_);
  std::error_code ec;
  socket_->open(endpoint.protocol(), ec);
  if(!ec) socket_->bind(endpoint, ec);
  if(ec) {
    socket_.reset();
    throw ConfigError("Cannot bind control socket to " + endpoint_to_string(endpoint) +
                      ": " + ec.message());
  }
  bound_port_ = socket_->local_endpoint().port();
  started_ = true;

  logger_->info("Coordinator listening on {}:{} (liveness window {} ms)",
                options_.bind_ip, bound_port_,
                std::chrono::duration_cast<std::chrono::milliseconds>(
                  coordinator_.sessions().liveness_window()).count());
  do_receive();
}

void CoordinatorServer::do_receive() {
  if(!socket_) return;
  socket_->async_receive_from(asio::buffer(buffer_), remote_,
    [this](std::error_code ec, std::size_t length){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        // ICMP port-unreachable from an earlier reply surfaces here on some platforms.
        logger_->debug("Receive error: {}", ec.message());
      } else {
        handle_datagram(length);
      }
      if(started_) do_receive();
    });
}

void CoordinatorServer::handle_datagram(std::size_t length) {
  const std::string payload(buffer_.data(), length);
  const udp::endpoint source = remote_;
  logger_->debug("Datagram from {}: {}", endpoint_to_string(source), payload);

  std::optional<std::string> reply;
  try {
    reply = coordinator_.process(payload, source, Coordinator::Clock::now());
  } catch(const std::exception& e) {
    logger_->error("Failed to handle datagram from {}: {}", endpoint_to_string(source), e.what());
    return;
  }
  datagrams_handled_.fetch_add(1);
  if(!reply) return;

  std::error_code ec;
  socket_->send_to(asio::buffer(*reply), source, 0, ec);
  if(ec) {
    logger_->warn("Reply to {} failed: {}", endpoint_to_string(source), ec.message());
  }
}

void CoordinatorServer::run() {
  if(!started_) start();
  io_.run();
}

void CoordinatorServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void CoordinatorServer::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(socket_) {
    std::error_code ec;
    socket_->close(ec);
  }
  socket_.reset();
  io_.restart();
  logger_->info("Coordinator stopped");
}
