#include "protocol.hpp"

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace {

struct WireName {
  MessageType type;
  const char* name;
};

constexpr WireName kWireNames[] = {
  {MessageType::Authenticate, "AUTH"},
  {MessageType::Heartbeat,    "STATUS"},
  {MessageType::ListPeers,    "LIST_PEERS"},
  {MessageType::ListFiles,    "LIST_FILES"},
  {MessageType::Share,        "SHARE"},
  {MessageType::Search,       "SEARCH"},
  {MessageType::Remove,       "REMOVE"},
  {MessageType::Fetch,        "FETCH"},
};

const char* listing_header(ListingKind kind) {
  switch(kind) {
    case ListingKind::Peers:         return "active peers:";
    case ListingKind::SharedFiles:   return "file shared:";
    case ListingKind::SearchResults: return "files found:";
  }
  return "";
}

const char* listing_empty_reply(ListingKind kind) {
  switch(kind) {
    case ListingKind::Peers:         return kReplyNoPeers;
    case ListingKind::SharedFiles:   return kReplyNoFilesShared;
    case ListingKind::SearchResults: return kReplyNoFilesFound;
  }
  return "";
}

bool read_string_field(const json& doc, const char* key, std::string& target, std::string& error) {
  auto it = doc.find(key);
  if(it == doc.end() || !it->is_string()) {
    error = std::string("missing string field '") + key + "'";
    return false;
  }
  target = it->get<std::string>();
  return true;
}

bool read_port_field(const json& doc, const char* key, uint16_t& target, std::string& error) {
  auto it = doc.find(key);
  if(it == doc.end() || !it->is_number_integer()) {
    error = std::string("missing integer field '") + key + "'";
    return false;
  }
  const auto value = it->get<int64_t>();
  if(value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
    error = std::string("field '") + key + "' is not a valid port";
    return false;
  }
  target = static_cast<uint16_t>(value);
  return true;
}

} // namespace

const char* wire_name(MessageType type) {
  for(const auto& entry : kWireNames) {
    if(entry.type == type) return entry.name;
  }
  return "";
}

std::optional<MessageType> message_type_from_wire(const std::string& name) {
  for(const auto& entry : kWireNames) {
    if(name == entry.name) return entry.type;
  }
  return std::nullopt;
}

ParseStatus parse_control_request(const std::string& payload,
                                  ControlRequest& out,
                                  std::string& error) {
  error.clear();
  json doc = json::parse(payload, nullptr, false);
  if(doc.is_discarded()) {
    error = "payload is not valid JSON";
    return ParseStatus::Malformed;
  }
  if(!doc.is_object()) {
    error = "payload is not a JSON object";
    return ParseStatus::Malformed;
  }

  std::string type_name;
  if(!read_string_field(doc, "type", type_name, error)) {
    return ParseStatus::Malformed;
  }
  auto type = message_type_from_wire(type_name);
  if(!type) {
    error = "unknown message type '" + type_name + "'";
    return ParseStatus::UnknownType;
  }

  ControlRequest request;
  request.type = *type;
  if(!read_string_field(doc, "username", request.username, error)) {
    return ParseStatus::Malformed;
  }
  if(request.username.empty()) {
    error = "empty username";
    return ParseStatus::Malformed;
  }

  switch(request.type) {
    case MessageType::Authenticate:
      if(!read_string_field(doc, "password", request.password, error)) return ParseStatus::Malformed;
      if(!read_port_field(doc, "tcpPort", request.transfer_port, error)) return ParseStatus::Malformed;
      break;
    case MessageType::Share:
    case MessageType::Remove:
    case MessageType::Fetch:
      if(!read_string_field(doc, "filename", request.filename, error)) return ParseStatus::Malformed;
      if(request.filename.empty()) {
        error = "empty filename";
        return ParseStatus::Malformed;
      }
      if(std::any_of(request.filename.begin(), request.filename.end(),
                     [](unsigned char ch){ return std::iscntrl(ch) != 0; })) {
        error = "control character in filename";
        return ParseStatus::Malformed;
      }
      break;
    case MessageType::Search:
      // An empty pattern matches every filename.
      if(!read_string_field(doc, "filename", request.filename, error)) return ParseStatus::Malformed;
      break;
    case MessageType::Heartbeat:
    case MessageType::ListPeers:
    case MessageType::ListFiles:
      break;
  }

  out = std::move(request);
  return ParseStatus::Ok;
}

json make_auth_request(const std::string& username,
                       const std::string& password,
                       uint16_t transfer_port) {
  json j;
  j["type"] = wire_name(MessageType::Authenticate);
  j["username"] = username;
  j["password"] = password;
  j["tcpPort"] = transfer_port;
  return j;
}

json make_status_message(const std::string& username) {
  return make_user_request(MessageType::Heartbeat, username);
}

json make_user_request(MessageType type, const std::string& username) {
  json j;
  j["type"] = wire_name(type);
  j["username"] = username;
  return j;
}

json make_file_request(MessageType type,
                       const std::string& username,
                       const std::string& filename) {
  json j = make_user_request(type, username);
  j["filename"] = filename;
  return j;
}

std::string render_listing_reply(ListingKind kind, const std::vector<std::string>& names) {
  if(names.empty()) return listing_empty_reply(kind);
  std::ostringstream oss;
  oss << names.size() << " " << listing_header(kind);
  for(const auto& name : names) {
    oss << "\n" << name;
  }
  return oss.str();
}

std::optional<std::vector<std::string>> parse_listing_reply(ListingKind kind,
                                                            const std::string& reply) {
  if(reply == listing_empty_reply(kind)) return std::vector<std::string>{};

  std::istringstream iss(reply);
  std::string header;
  if(!std::getline(iss, header)) return std::nullopt;

  std::istringstream header_stream(header);
  std::size_t count = 0;
  if(!(header_stream >> count)) return std::nullopt;
  std::string rest;
  std::getline(header_stream, rest);
  if(trim_copy(rest) != listing_header(kind)) return std::nullopt;

  std::vector<std::string> names;
  names.reserve(count);
  std::string line;
  while(std::getline(iss, line)) {
    names.push_back(line);
  }
  return names;
}

std::string render_fetch_reply(const FetchTarget& target) {
  json j;
  j["username"] = target.username;
  j["address"] = target.address;
  j["port"] = target.port;
  return j.dump();
}

std::optional<FetchTarget> parse_fetch_reply(const std::string& reply) {
  if(reply == kReplyFileNotFound) return std::nullopt;
  json doc = json::parse(reply, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) return std::nullopt;

  FetchTarget target;
  std::string error;
  if(!read_string_field(doc, "username", target.username, error)) return std::nullopt;
  if(!read_string_field(doc, "address", target.address, error)) return std::nullopt;
  if(!read_port_field(doc, "port", target.port, error)) return std::nullopt;
  return target;
}

std::string encode_transfer_request(const TransferRequest& request) {
  json j;
  j["username"] = request.username;
  j["filename"] = request.filename;
  return j.dump() + "\n";
}

std::optional<TransferRequest> decode_transfer_request(const std::string& buffer,
                                                       std::string& error) {
  error.clear();
  const auto newline = buffer.find('\n');
  const bool terminated = newline != std::string::npos;
  const std::string candidate = trim_copy(terminated ? buffer.substr(0, newline) : buffer);

  if(candidate.empty() || !json::accept(candidate)) {
    if(terminated || buffer.size() >= kMaxTransferRequestBytes) {
      error = "request is not a JSON object";
    }
    return std::nullopt;
  }

  json doc = json::parse(candidate);
  if(!doc.is_object()) {
    error = "request is not a JSON object";
    return std::nullopt;
  }
  TransferRequest request;
  if(!read_string_field(doc, "username", request.username, error)) return std::nullopt;
  if(!read_string_field(doc, "filename", request.filename, error)) return std::nullopt;
  return request;
}

std::string encode_size_token(uint64_t size) {
  return std::to_string(size) + "\n";
}

std::optional<uint64_t> decode_size_token(const std::string& token) {
  const std::string clean = trim_copy(token);
  if(clean.empty()) return std::nullopt;
  if(!std::all_of(clean.begin(), clean.end(),
                  [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
    return std::nullopt;
  }
  try {
    return static_cast<uint64_t>(std::stoull(clean));
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}

bool is_partial_size_token(const std::string& token) {
  if(token.size() > std::numeric_limits<uint64_t>::digits10 + 4) return false;
  return std::all_of(token.begin(), token.end(), [](unsigned char ch){
    return std::isdigit(ch) != 0 || ch == ' ' || ch == '\r';
  });
}

bool is_plain_filename(const std::string& filename) {
  if(filename.empty() || filename == "." || filename == "..") return false;
  return filename.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}
