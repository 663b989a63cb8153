#include "coordinator.hpp"

#include "utils.hpp"

Coordinator::Coordinator(CredentialStore credentials,
                         Clock::duration liveness_window,
                         std::shared_ptr<Logger> logger)
  : credentials_(std::move(credentials)),
    sessions_(liveness_window),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")) {}

std::optional<std::string> Coordinator::process(const std::string& payload,
                                                const asio::ip::udp::endpoint& source,
                                                Clock::time_point now) {
  std::optional<std::string> reply;
  ControlRequest request;
  std::string error;
  switch(parse_control_request(payload, request, error)) {
    case ParseStatus::Ok:
      try {
        reply = dispatch(request, source, now);
      } catch(const std::exception& e) {
        logger_->error("{} request from {} failed: {}",
                       wire_name(request.type), endpoint_to_string(source), e.what());
        reply = kReplyMalformed;
      }
      break;
    case ParseStatus::Malformed:
      logger_->warn("Malformed request from {}: {}", endpoint_to_string(source), error);
      reply = kReplyMalformed;
      break;
    case ParseStatus::UnknownType:
      logger_->warn("Dropping datagram from {}: {}", endpoint_to_string(source), error);
      break;
  }

  sweep(now);
  return reply;
}

std::optional<std::string> Coordinator::dispatch(const ControlRequest& request,
                                                 const asio::ip::udp::endpoint& source,
                                                 Clock::time_point now) {
  const auto& user = request.username;
  switch(request.type) {
    case MessageType::Authenticate: {
      auto result = authenticate(user, request.password, request.transfer_port, source, now);
      switch(result) {
        case AuthError::None:          return std::string(kReplyOk);
        case AuthError::AlreadyActive: return std::string(kReplyAlreadyActive);
        case AuthError::UnknownUser:   return std::string(kReplyUnknownUser);
        case AuthError::BadPassword:   return std::string(kReplyBadPassword);
        default:                       return std::string(kReplyMalformed);
      }
    }
    case MessageType::Heartbeat:
      heartbeat(user, source, now);
      return std::nullopt;
    case MessageType::ListPeers:
      return render_listing_reply(ListingKind::Peers, list_peers(user));
    case MessageType::ListFiles:
      return render_listing_reply(ListingKind::SharedFiles, list_files(user));
    case MessageType::Share:
      share(user, request.filename);
      return std::string(kReplyShared);
    case MessageType::Search:
      return render_listing_reply(ListingKind::SearchResults, search(user, request.filename));
    case MessageType::Remove:
      return std::string(remove(user, request.filename) ? kReplyRemoved : kReplyRemoveFailed);
    case MessageType::Fetch: {
      auto target = fetch(user, request.filename);
      if(!target) return std::string(kReplyFileNotFound);
      return render_fetch_reply(*target);
    }
  }
  return std::nullopt;
}

AuthError Coordinator::authenticate(const std::string& username,
                                    const std::string& password,
                                    uint16_t transfer_port,
                                    const asio::ip::udp::endpoint& source,
                                    Clock::time_point now) {
  AuthError result = AuthError::None;
  if(sessions_.is_live(username)) {
    result = AuthError::AlreadyActive;
  } else if(!credentials_.contains(username)) {
    result = AuthError::UnknownUser;
  } else if(!credentials_.matches(username, password)) {
    result = AuthError::BadPassword;
  } else {
    Session session;
    session.username = username;
    session.endpoint = source;
    session.transfer_port = transfer_port;
    sessions_.open(std::move(session), now);
  }

  if(result == AuthError::None) {
    logger_->info("{} authenticated from {} (transfer port {})",
                  username, endpoint_to_string(source), transfer_port);
  } else {
    logger_->info("Authentication for {} from {} rejected: {}",
                  username, endpoint_to_string(source), to_string(result));
  }
  return result;
}

void Coordinator::heartbeat(const std::string& username,
                            const asio::ip::udp::endpoint& source,
                            Clock::time_point now) {
  if(sessions_.refresh(username, source, now)) {
    logger_->debug("Heartbeat from {} at {}", username, endpoint_to_string(source));
  }
}

std::vector<std::string> Coordinator::list_peers(const std::string& username) const {
  std::vector<std::string> peers;
  for(auto& name : sessions_.live_usernames()) {
    if(name != username) peers.push_back(std::move(name));
  }
  return peers;
}

std::vector<std::string> Coordinator::list_files(const std::string& username) const {
  return files_.files_shared_by(username);
}

void Coordinator::share(const std::string& username, const std::string& filename) {
  files_.share(filename, username);
  logger_->info("{} shares {}", username, filename);
}

std::vector<std::string> Coordinator::search(const std::string& username,
                                             const std::string& pattern) const {
  return files_.search(pattern, live_sharer_other_than(username));
}

bool Coordinator::remove(const std::string& username, const std::string& filename) {
  const bool removed = files_.remove(filename, username);
  if(removed) {
    logger_->info("{} stopped sharing {}", username, filename);
  }
  return removed;
}

std::optional<FetchTarget> Coordinator::fetch(const std::string& username,
                                              const std::string& filename) const {
  auto sharer = files_.first_sharer(filename, live_sharer_other_than(username));
  if(!sharer) {
    logger_->info("Fetch of {} for {}: no live sharer", filename, username);
    return std::nullopt;
  }
  const Session* session = sessions_.find(*sharer);
  FetchTarget target;
  target.username = *sharer;
  target.address = session->endpoint.address().to_string();
  target.port = session->transfer_port;
  logger_->info("Fetch of {} for {} resolved to {} at {}:{}",
                filename, username, target.username, target.address, target.port);
  return target;
}

std::vector<std::string> Coordinator::sweep(Clock::time_point now) {
  auto evicted = sessions_.sweep(now);
  for(const auto& name : evicted) {
    logger_->info("Session for {} expired", name);
  }
  return evicted;
}

FileIndex::SharerFilter Coordinator::live_sharer_other_than(const std::string& username) const {
  return [this, username](const std::string& sharer) {
    return sharer != username && sessions_.is_live(sharer);
  };
}
