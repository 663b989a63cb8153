#include "heartbeat_loop.hpp"

#include "protocol.hpp"
#include "utils.hpp"

HeartbeatLoop::HeartbeatLoop(const AuthState& auth,
                             asio::ip::udp::endpoint coordinator,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<Logger> logger)
  : auth_(auth),
    coordinator_(std::move(coordinator)),
    interval_(interval.count() > 0 ? interval : kDefaultInterval),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("heartbeat")),
    socket_(io_) {}

HeartbeatLoop::~HeartbeatLoop() {
  stop();
}

void HeartbeatLoop::start() {
  stop();

  std::error_code ec;
  if(!socket_.is_open()) {
    socket_.open(coordinator_.protocol(), ec);
    if(ec) {
      logger_->error("Cannot open heartbeat socket: {}", ec.message());
      return;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stop_requested_ = false;
  running_ = true;
  thread_ = std::thread([this](){ run(); });
}

void HeartbeatLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if(thread_.joinable()) {
    thread_.join();
  }
}

bool HeartbeatLoop::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t HeartbeatLoop::beats_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return beats_sent_;
}

void HeartbeatLoop::run() {
  logger_->debug("Heartbeat loop started ({} ms) towards {}",
                 interval_.count(), endpoint_to_string(coordinator_));
  std::unique_lock<std::mutex> lock(mutex_);
  while(!stop_requested_) {
    lock.unlock();
    const bool sent = beat();
    lock.lock();
    if(!sent) break;
    ++beats_sent_;
    cv_.wait_for(lock, interval_, [this]{ return stop_requested_; });
  }
  running_ = false;
  lock.unlock();
  logger_->debug("Heartbeat loop stopped");
}

bool HeartbeatLoop::beat() {
  auto state = auth_.snapshot();
  if(!state.authenticated) {
    return false;
  }
  const std::string payload = make_status_message(state.username).dump();
  std::error_code ec;
  socket_.send_to(asio::buffer(payload), coordinator_, 0, ec);
  if(ec) {
    // A lost heartbeat is indistinguishable from a dropped datagram; keep going.
    logger_->warn("Heartbeat for {} failed: {}", state.username, ec.message());
  }
  return true;
}
