#include "control_client.hpp"

#include "errors.hpp"
#include "utils.hpp"

ControlClient::ControlClient(const std::string& server_ip,
                             uint16_t server_port,
                             std::chrono::milliseconds reply_timeout,
                             std::shared_ptr<Logger> logger)
  : socket_(io_),
    reply_timeout_(reply_timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("control-client")) {
  asio::ip::address address;
  try {
    address = asio::ip::make_address(server_ip);
  } catch(const std::exception& e) {
    throw ConfigError("Invalid server_ip '" + server_ip + "': " + e.what());
  }
  server_ = udp::endpoint(address, server_port);

  std::error_code ec;
  socket_.open(server_.protocol(), ec);
  if(!ec) socket_.bind(udp::endpoint(server_.protocol(), 0), ec);
  if(ec) {
    throw ConfigError("Cannot open control socket: " + ec.message());
  }
}

void ControlClient::drain_stale_replies() {
  std::error_code ec;
  while(socket_.available(ec) > 0 && !ec) {
    udp::endpoint from;
    auto n = socket_.receive_from(asio::buffer(buffer_), from, 0, ec);
    if(ec) break;
    logger_->debug("Discarding stale datagram from {} ({} bytes)", endpoint_to_string(from), n);
  }
}

bool ControlClient::send(const nlohmann::json& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string payload = message.dump();
  std::error_code ec;
  socket_.send_to(asio::buffer(payload), server_, 0, ec);
  if(ec) {
    logger_->warn("Send to {} failed: {}", endpoint_to_string(server_), ec.message());
    return false;
  }
  return true;
}

std::optional<std::string> ControlClient::request(const nlohmann::json& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  drain_stale_replies();

  const std::string payload = message.dump();
  std::error_code ec;
  socket_.send_to(asio::buffer(payload), server_, 0, ec);
  if(ec) {
    logger_->warn("Send to {} failed: {}", endpoint_to_string(server_), ec.message());
    return std::nullopt;
  }
  logger_->debug("-> {}", payload);

  std::optional<std::string> reply;
  udp::endpoint from;
  std::function<void()> receive_next;
  receive_next = [&](){
    socket_.async_receive_from(asio::buffer(buffer_), from,
      [&](std::error_code rec, std::size_t length){
        if(rec) {
          if(rec != asio::error::operation_aborted) {
            logger_->debug("Receive failed: {}", rec.message());
          }
          return;
        }
        if(from != server_) {
          logger_->debug("Ignoring datagram from {}", endpoint_to_string(from));
          receive_next();
          return;
        }
        reply.emplace(buffer_.data(), length);
      });
  };

  io_.restart();
  receive_next();
  io_.run_for(reply_timeout_);
  if(!io_.stopped()) {
    socket_.cancel(ec);
    io_.run();
  }

  if(!reply) {
    logger_->warn("No reply from {} within {} ms to {}",
                  endpoint_to_string(server_), reply_timeout_.count(),
                  message.value("type", std::string("?")));
    return std::nullopt;
  }
  logger_->debug("<- {}", *reply);
  return reply;
}
