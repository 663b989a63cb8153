#include "peer_agent.hpp"

#include <system_error>

namespace {

TransferServer::Options transfer_options(const PeerAgent::Options& options) {
  TransferServer::Options out;
  out.bind_ip = options.transfer_ip;
  out.port = 0;
  out.workspace_root = options.workspace_root;
  out.read_timeout = options.transfer_read_timeout;
  out.transfer_debug = options.transfer_debug;
  return out;
}

AuthError auth_error_from_reply(const std::string& reply) {
  if(reply == kReplyOk) return AuthError::None;
  if(reply == kReplyAlreadyActive) return AuthError::AlreadyActive;
  if(reply == kReplyUnknownUser) return AuthError::UnknownUser;
  if(reply == kReplyBadPassword) return AuthError::BadPassword;
  return AuthError::Rejected;
}

ControlReply make_reply(ControlReply::Status status, std::string message) {
  ControlReply reply;
  reply.status = status;
  reply.message = std::move(message);
  return reply;
}

} // namespace

const char* to_string(ControlReply::Status status) {
  switch(status) {
    case ControlReply::Status::Ok:               return "ok";
    case ControlReply::Status::Failed:           return "failed";
    case ControlReply::Status::Timeout:          return "timeout";
    case ControlReply::Status::NotAuthenticated: return "not authenticated";
    case ControlReply::Status::Unexpected:       return "unexpected reply";
  }
  return "unknown";
}

PeerAgent::PeerAgent(Options options)
  : options_(std::move(options)),
    logger_(std::make_shared<Logger>("peer-agent")),
    control_logger_(std::make_shared<Logger>("control-client")),
    heartbeat_logger_(std::make_shared<Logger>("heartbeat")),
    transfer_logger_(std::make_shared<Logger>("transfer")),
    control_(options_.server_ip, options_.server_port, options_.request_timeout, control_logger_),
    heartbeat_(auth_, control_.server_endpoint(), options_.heartbeat_interval, heartbeat_logger_),
    transfer_(auth_, transfer_options(options_), transfer_logger_) {
  if(options_.server_port == 0) {
    throw ConfigError("server_port must be between 1 and 65535");
  }
}

PeerAgent::~PeerAgent() {
  stop();
}

void PeerAgent::start() {
  if(started_) return;
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  transfer_.start_background();
  started_ = true;
}

void PeerAgent::stop() {
  sign_out();
  transfer_.stop();
  started_ = false;
}

void PeerAgent::sign_out() {
  auto state = auth_.snapshot();
  auth_.sign_out();
  heartbeat_.stop();
  if(state.authenticated) {
    logger_->info("{} signed out", state.username);
  }
}

std::filesystem::path PeerAgent::user_directory() const {
  auto state = auth_.snapshot();
  if(state.username.empty()) return {};
  return options_.workspace_root / state.username;
}

bool PeerAgent::ensure_user_directory(const std::string& username) const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / username, ec);
  if(ec) {
    logger_->error("Cannot create directory for {}: {}", username, ec.message());
    return false;
  }
  return true;
}

AuthOutcome PeerAgent::authenticate(const std::string& username, const std::string& password) {
  AuthOutcome outcome;
  if(auth_.authenticated()) {
    outcome.error = AuthError::AlreadyActive;
    outcome.reply = kReplyAlreadyActive;
    return outcome;
  }
  if(!started_) start();

  auto reply = control_.request(make_auth_request(username, password, transfer_.bound_port()));
  if(!reply) {
    outcome.error = AuthError::Timeout;
    return outcome;
  }
  outcome.reply = *reply;
  outcome.error = auth_error_from_reply(*reply);
  if(!outcome.ok()) {
    logger_->info("Authentication as {} failed: {}", username, *reply);
    return outcome;
  }

  ensure_user_directory(username);
  auth_.sign_in(username);
  heartbeat_.start();
  logger_->info("Signed in as {} (transfer port {})", username, transfer_.bound_port());
  return outcome;
}

std::optional<AuthState::Snapshot> PeerAgent::signed_in(ControlReply& reply) const {
  auto state = auth_.snapshot();
  if(!state.authenticated) {
    reply = make_reply(ControlReply::Status::NotAuthenticated, "Not signed in");
    return std::nullopt;
  }
  return state;
}

ControlReply PeerAgent::listing(MessageType type, ListingKind kind, const std::string& pattern) {
  ControlReply result;
  auto state = signed_in(result);
  if(!state) return result;

  auto message = type == MessageType::Search
    ? make_file_request(type, state->username, pattern)
    : make_user_request(type, state->username);
  auto reply = control_.request(message);
  if(!reply) return make_reply(ControlReply::Status::Timeout, "No reply from coordinator");

  auto names = parse_listing_reply(kind, *reply);
  if(!names) {
    logger_->warn("Unexpected {} reply: {}", wire_name(type), *reply);
    return make_reply(ControlReply::Status::Unexpected, *reply);
  }
  result = make_reply(ControlReply::Status::Ok, *reply);
  result.items = std::move(*names);
  return result;
}

ControlReply PeerAgent::list_peers() {
  return listing(MessageType::ListPeers, ListingKind::Peers);
}

ControlReply PeerAgent::list_files() {
  return listing(MessageType::ListFiles, ListingKind::SharedFiles);
}

ControlReply PeerAgent::search(const std::string& pattern) {
  return listing(MessageType::Search, ListingKind::SearchResults, pattern);
}

ControlReply PeerAgent::share(const std::string& filename) {
  ControlReply result;
  auto state = signed_in(result);
  if(!state) return result;

  std::error_code ec;
  if(!is_plain_filename(filename) ||
     !std::filesystem::is_regular_file(options_.workspace_root / state->username / filename, ec)) {
    return make_reply(ControlReply::Status::Failed, kReplyFileNotFound);
  }

  auto reply = control_.request(make_file_request(MessageType::Share, state->username, filename));
  if(!reply) return make_reply(ControlReply::Status::Timeout, "No reply from coordinator");
  if(*reply == kReplyShared) return make_reply(ControlReply::Status::Ok, *reply);
  return make_reply(ControlReply::Status::Unexpected, *reply);
}

ControlReply PeerAgent::remove(const std::string& filename) {
  ControlReply result;
  auto state = signed_in(result);
  if(!state) return result;

  auto reply = control_.request(make_file_request(MessageType::Remove, state->username, filename));
  if(!reply) return make_reply(ControlReply::Status::Timeout, "No reply from coordinator");
  if(*reply == kReplyRemoved) return make_reply(ControlReply::Status::Ok, *reply);
  if(*reply == kReplyRemoveFailed) return make_reply(ControlReply::Status::Failed, *reply);
  return make_reply(ControlReply::Status::Unexpected, *reply);
}

FetchOutcome PeerAgent::fetch(const std::string& filename, TransferProgress progress) {
  FetchOutcome outcome;
  auto state = signed_in(outcome.lookup);
  if(!state) return outcome;

  if(!is_plain_filename(filename)) {
    outcome.lookup = make_reply(ControlReply::Status::Failed, kReplyFileNotFound);
    return outcome;
  }

  auto reply = control_.request(make_file_request(MessageType::Fetch, state->username, filename));
  if(!reply) {
    outcome.lookup = make_reply(ControlReply::Status::Timeout, "No reply from coordinator");
    return outcome;
  }
  if(*reply == kReplyFileNotFound) {
    outcome.lookup = make_reply(ControlReply::Status::Failed, *reply);
    return outcome;
  }
  outcome.target = parse_fetch_reply(*reply);
  if(!outcome.target) {
    logger_->warn("Unexpected FETCH reply: {}", *reply);
    outcome.lookup = make_reply(ControlReply::Status::Unexpected, *reply);
    return outcome;
  }
  outcome.lookup = make_reply(ControlReply::Status::Ok, *reply);

  if(!ensure_user_directory(state->username)) {
    outcome.transfer.error = TransferError::LocalWriteFailed;
    outcome.transfer.detail = "cannot create user directory";
    return outcome;
  }

  TransferConfig config;
  config.connect_timeout = options_.connect_timeout;
  config.read_timeout = options_.connect_timeout;
  config.transfer_debug = options_.transfer_debug;
  config.progress = std::move(progress);
  outcome.transfer = fetch_file(*outcome.target, state->username, filename,
                                options_.workspace_root / state->username,
                                config, transfer_logger_.get());
  if(!outcome.transfer.ok()) {
    logger_->warn("Fetching {} from {} failed: {} ({})",
                  filename, outcome.target->username,
                  to_string(outcome.transfer.error), outcome.transfer.detail);
  }
  return outcome;
}

void PeerAgent::add_log_listener(const Logger::Listener& listener) {
  for(auto* logger : {logger_.get(), control_logger_.get(), heartbeat_logger_.get(), transfer_logger_.get()}) {
    logger->add_listener(listener);
  }
}

void PeerAgent::clear_log_listeners() {
  for(auto* logger : {logger_.get(), control_logger_.get(), heartbeat_logger_.get(), transfer_logger_.get()}) {
    logger->clear_listeners();
  }
}
