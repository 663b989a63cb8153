#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
// Control channel: one JSON object per datagram, discriminated by "type".
// Transfer channel: request object, size token, ACK, raw bytes.

enum class MessageType {
  Authenticate,
  Heartbeat,
  ListPeers,
  ListFiles,
  Share,
  Search,
  Remove,
  Fetch
};

const char* wire_name(MessageType type);
std::optional<MessageType> message_type_from_wire(const std::string& name);

struct ControlRequest {
  MessageType type = MessageType::Heartbeat;
  std::string username;
  std::string password;     // Authenticate only
  std::string filename;     // Share, Search (pattern), Remove, Fetch
  uint16_t transfer_port = 0; // Authenticate only
};

enum class ParseStatus {
  Ok,
  Malformed,
  UnknownType
};

ParseStatus parse_control_request(const std::string& payload,
                                  ControlRequest& out,
                                  std::string& error);

json make_auth_request(const std::string& username,
                       const std::string& password,
                       uint16_t transfer_port);
json make_status_message(const std::string& username);
json make_user_request(MessageType type, const std::string& username);
json make_file_request(MessageType type,
                       const std::string& username,
                       const std::string& filename);

// ---- replies ----------------------------------------------------------------

inline constexpr const char* kReplyOk = "OK";
inline constexpr const char* kReplyAlreadyActive = "ERROR: User already logged in";
inline constexpr const char* kReplyUnknownUser = "ERROR: Username not found";
inline constexpr const char* kReplyBadPassword = "ERROR: Incorrect password";
inline constexpr const char* kReplyMalformed = "ERROR: Malformed request";
inline constexpr const char* kReplyNoPeers = "No active peers";
inline constexpr const char* kReplyNoFilesShared = "No files shared";
inline constexpr const char* kReplyShared = "File shared successfully";
inline constexpr const char* kReplyNoFilesFound = "No files found";
inline constexpr const char* kReplyRemoved = "File successfully removed from sharing";
inline constexpr const char* kReplyRemoveFailed = "File removal failed";
inline constexpr const char* kReplyFileNotFound = "File not found";

enum class ListingKind {
  Peers,
  SharedFiles,
  SearchResults
};

std::string render_listing_reply(ListingKind kind, const std::vector<std::string>& names);

// Returns nullopt when the reply is not a listing of the given kind.
std::optional<std::vector<std::string>> parse_listing_reply(ListingKind kind,
                                                            const std::string& reply);

struct FetchTarget {
  std::string username;
  std::string address;
  uint16_t port = 0;
};

std::string render_fetch_reply(const FetchTarget& target);
std::optional<FetchTarget> parse_fetch_reply(const std::string& reply);

// ---- transfer channel -------------------------------------------------------

inline constexpr std::size_t kTransferChunkSize = 1024;
inline constexpr std::size_t kMaxTransferRequestBytes = 1024;
inline constexpr const char kTransferAck[] = "ACK";
inline constexpr std::size_t kTransferAckSize = 3;

struct TransferRequest {
  std::string username;
  std::string filename;
};

std::string encode_transfer_request(const TransferRequest& request);

// Accepts a buffer that may still be incomplete. Returns nullopt and leaves
// error empty while more bytes are needed; sets error when the bytes can
// never become a valid request.
std::optional<TransferRequest> decode_transfer_request(const std::string& buffer,
                                                       std::string& error);

std::string encode_size_token(uint64_t size);
std::optional<uint64_t> decode_size_token(const std::string& token);
// True while the bytes read so far could still grow into a valid size token.
bool is_partial_size_token(const std::string& token);

// A bare file name: no directory components, not "." or "..".
bool is_plain_filename(const std::string& filename);
