#include "command_line_parser.hpp"
#include "control_client.hpp"
#include "coordinator.hpp"
#include "coordinator_server.hpp"
#include "credential_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace {

using filemesh::test::TestCase;
using filemesh::test::TestContext;
using namespace std::chrono_literals;
using Clock = Coordinator::Clock;
using udp = asio::ip::udp;

udp::endpoint endpoint_for(uint16_t port) {
  return udp::endpoint(asio::ip::make_address("127.0.0.1"), port);
}

CredentialStore sample_credentials() {
  return CredentialStore({{"alice", "s1"}, {"bob", "s2"}, {"carol", "s3"}, {"dave", "s4"}});
}

std::shared_ptr<Logger> attached_logger(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("coordinator");
  ctx.logs.attach(logger);
  return logger;
}

std::string auth(const std::string& user, const std::string& password, uint16_t port = 7000) {
  return make_auth_request(user, password, port).dump();
}

std::string user_request(MessageType type, const std::string& user) {
  return make_user_request(type, user).dump();
}

std::string file_request(MessageType type, const std::string& user, const std::string& filename) {
  return make_file_request(type, user, filename).dump();
}

bool test_authenticate_outcomes(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), Coordinator::kDefaultLivenessWindow, attached_logger(ctx));
  const auto t0 = Clock::now();
  bool ok = true;
  ok &= ctx.expect(coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0) == std::string(kReplyOk),
                   "first alice login accepted");
  ok &= ctx.expect(coordinator.sessions().is_live("alice"), "alice has a live session");
  ok &= ctx.expect(coordinator.process(auth("alice", "s1"), endpoint_for(5002), t0 + 1s) == std::string(kReplyAlreadyActive),
                   "second alice login rejected as already active");
  // Already-active is checked before the password.
  ok &= ctx.expect(coordinator.process(auth("alice", "wrong"), endpoint_for(5002), t0 + 1s) == std::string(kReplyAlreadyActive),
                   "wrong password on live user reports already active");
  ok &= ctx.expect(coordinator.process(auth("mallory", "x"), endpoint_for(5003), t0) == std::string(kReplyUnknownUser),
                   "unknown user rejected");
  ok &= ctx.expect(coordinator.process(auth("bob", "nope"), endpoint_for(5004), t0) == std::string(kReplyBadPassword),
                   "bad password rejected");
  ok &= ctx.expect(!coordinator.sessions().is_live("bob"), "failed login creates no session");
  ok &= ctx.expect(coordinator.sessions().size() == 1, "exactly one session");
  return ok;
}

bool test_expired_session_is_swept(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);
  coordinator.process(auth("bob", "s2"), endpoint_for(5002), t0);

  bool ok = true;
  ok &= ctx.expect(coordinator.process(user_request(MessageType::ListPeers, "bob"), endpoint_for(5002), t0 + 1s)
                   == std::string("1 active peers:\nalice"), "bob sees alice while alice is live");

  coordinator.process(make_status_message("bob").dump(), endpoint_for(5002), t0 + 2s);
  coordinator.process(make_status_message("bob").dump(), endpoint_for(5002), t0 + 3500ms);
  auto reply = coordinator.process(user_request(MessageType::ListPeers, "bob"), endpoint_for(5002), t0 + 3600ms);
  ok &= ctx.expect(reply == std::string(kReplyNoPeers), "alice no longer listed after the window");
  ok &= ctx.expect(coordinator.sessions().size() == 1, "alice evicted by the sweep");
  ok &= ctx.expect(ctx.logs.contains("Session for alice expired"), "eviction logged");

  // An evicted user may log in again.
  ok &= ctx.expect(coordinator.process(auth("alice", "s1"), endpoint_for(5009), t0 + 4s) == std::string(kReplyOk),
                   "alice can re-authenticate after eviction");
  return ok;
}

bool test_late_heartbeat_before_sweep_keeps_session(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1", 7001), endpoint_for(5001), t0);
  coordinator.process(file_request(MessageType::Share, "alice", "a.txt"), endpoint_for(5001), t0);
  coordinator.process(auth("bob", "s2", 7002), endpoint_for(5002), t0 + 3s);

  // Past the window with no sweep since bob logged in.
  const auto late = t0 + 4s;
  bool ok = true;
  ok &= ctx.expect(coordinator.process(auth("alice", "s1", 7003), endpoint_for(5003), late)
                   == std::string(kReplyAlreadyActive), "unswept alice still blocks a second login");
  ok &= ctx.expect(coordinator.sessions().size() == 1, "the sweep after that login evicted alice");

  Coordinator refreshed(sample_credentials(), 3s, attached_logger(ctx));
  refreshed.process(auth("alice", "s1", 7001), endpoint_for(5001), t0);
  refreshed.process(file_request(MessageType::Share, "alice", "a.txt"), endpoint_for(5001), t0);
  refreshed.process(auth("bob", "s2", 7002), endpoint_for(5002), t0 + 3s);
  ok &= ctx.expect(!refreshed.process(make_status_message("alice").dump(), endpoint_for(5001), late),
                   "late heartbeat gets no reply");
  ok &= ctx.expect(refreshed.sessions().is_live("alice"), "late heartbeat refreshed alice before the sweep");
  ok &= ctx.expect(refreshed.process(user_request(MessageType::ListPeers, "bob"), endpoint_for(5002), late + 100ms)
                   == std::string("1 active peers:\nalice"), "bob still sees alice");
  ok &= ctx.expect(refreshed.process(file_request(MessageType::Search, "bob", "a"), endpoint_for(5002), late + 100ms)
                   == std::string("1 files found:\na.txt"), "alice's file still found");
  ok &= ctx.expect(refreshed.process(auth("alice", "s1", 7003), endpoint_for(5003), late + 200ms)
                   == std::string(kReplyAlreadyActive), "second login still rejected");
  return ok;
}

bool test_heartbeat_refreshes_and_ignores_unknown(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);

  bool ok = true;
  ok &= ctx.expect(!coordinator.process(make_status_message("alice").dump(), endpoint_for(6001), t0 + 2s),
                   "heartbeat gets no reply");
  ok &= ctx.expect(!coordinator.process(make_status_message("ghost").dump(), endpoint_for(6002), t0 + 2s),
                   "heartbeat from unknown user gets no reply");
  ok &= ctx.expect(coordinator.sessions().size() == 1, "unknown heartbeat creates no session");

  coordinator.process(make_status_message("ghost").dump(), endpoint_for(6002), t0 + 4s);
  const auto* session = coordinator.sessions().find("alice");
  ok &= ctx.expect(session != nullptr, "refreshed session survives a sweep past the first window");
  ok &= ctx.expect(session && session->endpoint.port() == 6001, "heartbeat updates the endpoint");
  ok &= ctx.expect(session && session->transfer_port == 7000, "transfer port kept");
  return ok;
}

bool test_share_is_idempotent(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);

  bool ok = true;
  for(int i = 0; i < 2; ++i) {
    ok &= ctx.expect(coordinator.process(file_request(MessageType::Share, "alice", "a.txt"), endpoint_for(5001), t0)
                     == std::string(kReplyShared), "share reports success");
  }
  auto sharers = coordinator.files().sharers("a.txt");
  ok &= ctx.expect(sharers.size() == 1 && sharers.count("alice") == 1, "alice listed exactly once");
  ok &= ctx.expect(coordinator.process(user_request(MessageType::ListFiles, "alice"), endpoint_for(5001), t0)
                   == std::string("1 file shared:\na.txt"), "myfiles lists a.txt once");
  ok &= ctx.expect(coordinator.process(user_request(MessageType::ListFiles, "bob"), endpoint_for(5002), t0)
                   == std::string(kReplyNoFilesShared), "bob shares nothing");
  return ok;
}

bool test_remove_last_sharer_deletes_record(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);
  coordinator.process(auth("bob", "s2"), endpoint_for(5002), t0);
  coordinator.process(file_request(MessageType::Share, "alice", "a.txt"), endpoint_for(5001), t0);

  bool ok = true;
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Search, "bob", "a.txt"), endpoint_for(5002), t0)
                   == std::string("1 files found:\na.txt"), "bob finds a.txt before removal");
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Remove, "alice", "a.txt"), endpoint_for(5001), t0)
                   == std::string(kReplyRemoved), "remove succeeds");
  ok &= ctx.expect(!coordinator.files().has("a.txt"), "record deleted with its last sharer");
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Search, "bob", "a.txt"), endpoint_for(5002), t0)
                   == std::string(kReplyNoFilesFound), "search finds nothing afterwards");
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Remove, "alice", "a.txt"), endpoint_for(5001), t0)
                   == std::string(kReplyRemoveFailed), "second remove fails");
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Remove, "bob", "never.txt"), endpoint_for(5002), t0)
                   == std::string(kReplyRemoveFailed), "removing an unknown file fails");
  return ok;
}

bool test_remove_keeps_other_sharers(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  coordinator.share("alice", "a.txt");
  coordinator.share("bob", "a.txt");

  bool ok = true;
  ok &= ctx.expect(!coordinator.remove("carol", "a.txt"), "non-sharer cannot remove");
  ok &= ctx.expect(coordinator.remove("alice", "a.txt"), "alice removes the alice entry");
  auto sharers = coordinator.files().sharers("a.txt");
  ok &= ctx.expect(sharers.size() == 1 && sharers.count("bob") == 1, "bob still shares a.txt");
  return ok;
}

bool test_search_filters_caller_and_offline(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.authenticate("alice", "s1", 7001, endpoint_for(5001), t0);
  coordinator.authenticate("bob", "s2", 7002, endpoint_for(5002), t0);
  coordinator.authenticate("carol", "s3", 7003, endpoint_for(5003), t0);
  coordinator.share("alice", "report.pdf");
  coordinator.share("bob", "report.pdf");
  coordinator.share("alice", "notes.txt");
  coordinator.share("dave", "report-old.pdf");  // dave never logged in

  bool ok = true;
  auto from_carol = coordinator.search("carol", "report");
  ok &= ctx.expect(from_carol == std::vector<std::string>{"report.pdf"},
                   "file shared twice reported once, offline sharer filtered");
  ok &= ctx.expect(coordinator.search("alice", "notes").empty(),
                   "a file shared only by the caller is never listed");
  auto everything = coordinator.search("carol", "");
  ok &= ctx.expect(everything == std::vector<std::string>{"notes.txt", "report.pdf"},
                   "empty pattern matches every reachable file, sorted");
  return ok;
}

bool test_fetch_picks_smallest_live_sharer(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.authenticate("carol", "s3", 7003, endpoint_for(5003), t0);
  coordinator.authenticate("bob", "s2", 7002, endpoint_for(5002), t0);
  coordinator.authenticate("dave", "s4", 7004, endpoint_for(5004), t0);
  coordinator.share("carol", "song.mp3");
  coordinator.share("bob", "song.mp3");
  coordinator.share("alice", "song.mp3");  // offline

  bool ok = true;
  auto reply = coordinator.process(file_request(MessageType::Fetch, "dave", "song.mp3"), endpoint_for(5004), t0);
  auto target = reply ? parse_fetch_reply(*reply) : std::nullopt;
  ok &= ctx.expect(target.has_value(), "fetch resolved");
  ok &= ctx.expect(target && target->username == "bob", "bob chosen as smallest live sharer");
  ok &= ctx.expect(target && target->address == "127.0.0.1" && target->port == 7002,
                   "reply carries bob's address and transfer port");

  auto self = coordinator.fetch("bob", "song.mp3");
  ok &= ctx.expect(self && self->username == "carol", "caller never chosen as its own source");
  ok &= ctx.expect(coordinator.process(file_request(MessageType::Fetch, "dave", "missing.bin"), endpoint_for(5004), t0)
                   == std::string(kReplyFileNotFound), "unknown file not found");
  return ok;
}

bool test_fetch_from_expired_sharer_not_found(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);
  coordinator.process(file_request(MessageType::Share, "alice", "a.txt"), endpoint_for(5001), t0);
  coordinator.process(auth("bob", "s2"), endpoint_for(5002), t0 + 2s);

  coordinator.process(make_status_message("bob").dump(), endpoint_for(5002), t0 + 4s);

  bool ok = true;
  auto reply = coordinator.process(file_request(MessageType::Fetch, "bob", "a.txt"), endpoint_for(5002), t0 + 4100ms);
  ok &= ctx.expect(reply == std::string(kReplyFileNotFound), "expired sharer yields not found");
  ok &= ctx.expect(coordinator.files().has("a.txt"), "record kept after its sharer expired");
  ok &= ctx.expect(!coordinator.sessions().is_live("alice"), "alice evicted");
  return ok;
}

bool test_malformed_request_then_valid(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  const std::vector<std::string> bad = {
    "not json at all",
    "[1,2,3]",
    R"({"username":"alice"})",
    R"({"type":42,"username":"alice"})",
    R"({"type":"AUTH","username":"alice","password":"s1"})",
    R"({"type":"AUTH","username":"alice","password":"s1","tcpPort":70000})",
    R"({"type":"SHARE","username":"alice"})",
    R"({"type":"LIST_PEERS","username":""})"
  };
  bool ok = true;
  for(const auto& payload : bad) {
    auto reply = coordinator.process(payload, endpoint_for(5001), t0);
    ok &= ctx.expect(reply == std::string(kReplyMalformed), "malformed reply for " + payload);
  }
  ok &= ctx.expect(coordinator.sessions().size() == 0, "no session created by malformed requests");
  ok &= ctx.expect(coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0) == std::string(kReplyOk),
                   "valid request after malformed ones succeeds");
  return ok;
}

bool test_filename_with_control_characters_rejected(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  const auto t0 = Clock::now();
  coordinator.process(auth("alice", "s1"), endpoint_for(5001), t0);

  const std::vector<std::string> names = {"a\nb", "tab\there", std::string("nul\0x", 5)};
  bool ok = true;
  for(auto type : {MessageType::Share, MessageType::Remove, MessageType::Fetch}) {
    for(const auto& name : names) {
      ok &= ctx.expect(coordinator.process(file_request(type, "alice", name), endpoint_for(5001), t0)
                       == std::string(kReplyMalformed),
                       std::string(wire_name(type)) + " rejects a control character");
    }
  }
  ok &= ctx.expect(coordinator.files().files_shared_by("alice").empty(), "nothing was indexed");

  coordinator.process(file_request(MessageType::Share, "alice", "one.txt"), endpoint_for(5001), t0);
  auto reply = coordinator.process(user_request(MessageType::ListFiles, "alice"), endpoint_for(5001), t0);
  ok &= ctx.expect(reply == std::string("1 file shared:\none.txt"), "listing count matches its lines");
  auto listing = reply ? parse_listing_reply(ListingKind::SharedFiles, *reply) : std::nullopt;
  ok &= ctx.expect(listing && listing->size() == 1 && listing->front() == "one.txt", "listing parses back");
  return ok;
}

bool test_unknown_type_dropped(TestContext& ctx) {
  Coordinator coordinator(sample_credentials(), 3s, attached_logger(ctx));
  auto reply = coordinator.process(R"({"type":"PING","username":"alice"})", endpoint_for(5001), Clock::now());
  bool ok = ctx.expect(!reply, "unknown type gets no reply");
  ok &= ctx.expect(ctx.logs.contains("unknown message type 'PING'"), "drop logged");
  return ok;
}

bool test_listing_reply_format(TestContext& ctx) {
  bool ok = true;
  ok &= ctx.expect(render_listing_reply(ListingKind::Peers, {"bob", "carol"}) == "2 active peers:\nbob\ncarol",
                   "peers listing format");
  ok &= ctx.expect(render_listing_reply(ListingKind::Peers, {}) == kReplyNoPeers, "empty peers listing");
  ok &= ctx.expect(render_listing_reply(ListingKind::SearchResults, {}) == kReplyNoFilesFound, "empty search listing");

  auto parsed = parse_listing_reply(ListingKind::SharedFiles, "2 file shared:\na.txt\nb.txt");
  ok &= ctx.expect(parsed && *parsed == std::vector<std::string>{"a.txt", "b.txt"}, "shared listing parsed");
  auto empty = parse_listing_reply(ListingKind::SharedFiles, kReplyNoFilesShared);
  ok &= ctx.expect(empty && empty->empty(), "empty shared listing parsed");
  ok &= ctx.expect(!parse_listing_reply(ListingKind::Peers, "2 files found:\na\nb"), "wrong kind rejected");
  ok &= ctx.expect(!parse_fetch_reply(kReplyFileNotFound), "not found is no fetch target");
  return ok;
}

bool test_transfer_framing_helpers(TestContext& ctx) {
  bool ok = true;
  std::string error;
  ok &= ctx.expect(!decode_transfer_request(R"({"username":"bob","filen)", error) && error.empty(),
                   "partial request waits for more bytes");
  auto request = decode_transfer_request("{\"username\":\"bob\",\"filename\":\"a.txt\"}\n", error);
  ok &= ctx.expect(request && request->username == "bob" && request->filename == "a.txt", "request decoded");
  auto unterminated = decode_transfer_request(R"({"username":"bob","filename":"a.txt"})", error);
  ok &= ctx.expect(unterminated.has_value(), "complete object without newline accepted");
  ok &= ctx.expect(!decode_transfer_request("garbage\n", error) && !error.empty(), "garbage rejected");

  ok &= ctx.expect(decode_size_token("2500\n") == std::optional<uint64_t>(2500), "terminated size token");
  ok &= ctx.expect(decode_size_token("2500") == std::optional<uint64_t>(2500), "bare size token");
  ok &= ctx.expect(!decode_size_token("12ab"), "non-digit token rejected");
  ok &= ctx.expect(!decode_size_token("-5"), "negative token rejected");
  ok &= ctx.expect(!decode_size_token(""), "empty token rejected");
  ok &= ctx.expect(is_partial_size_token("25"), "digits may still grow");
  ok &= ctx.expect(!is_partial_size_token("lots"), "letters can never become a size");
  ok &= ctx.expect(!is_partial_size_token(std::string(40, '9')), "overlong digit run stops the read");

  ok &= ctx.expect(is_plain_filename("a.txt"), "plain name accepted");
  ok &= ctx.expect(!is_plain_filename("../secret"), "parent traversal rejected");
  ok &= ctx.expect(!is_plain_filename("dir/a.txt"), "subdirectory rejected");
  ok &= ctx.expect(!is_plain_filename(".."), "dot-dot rejected");
  return ok;
}

bool test_credentials_parsing(TestContext& ctx) {
  std::istringstream in("alice s1\n\n  bob pass word  \r\ncarol s3\n");
  auto store = CredentialStore::parse(in);
  bool ok = true;
  ok &= ctx.expect(store.size() == 3, "three credentials");
  ok &= ctx.expect(store.matches("alice", "s1"), "alice password");
  ok &= ctx.expect(store.matches("bob", "pass word"), "password keeps inner spaces, trailing trimmed");
  ok &= ctx.expect(!store.matches("carol", "s1"), "wrong password rejected");
  ok &= ctx.expect(store.usernames() == std::vector<std::string>{"alice", "bob", "carol"}, "usernames sorted");

  std::istringstream broken("alice s1\nbob\n");
  bool threw = false;
  try {
    CredentialStore::parse(broken);
  } catch(const ConfigError&) {
    threw = true;
  }
  ok &= ctx.expect(threw, "line without password is a config error");
  return ok;
}

bool test_credentials_file_lookup(TestContext& ctx) {
  auto root = filemesh::test::prepare_workspace("credentials");
  bool ok = true;

  bool threw = false;
  try {
    CredentialStore::load_first_existing({root / "server" / "credentials.txt", root / "credentials.txt"});
  } catch(const ConfigError& e) {
    threw = std::string(e.what()).find("credentials.txt") != std::string::npos;
  }
  ok &= ctx.expect(threw, "missing credentials file is a config error naming the candidates");

  filemesh::test::write_file(root / "credentials.txt", "zoe z1\n");
  std::filesystem::path used;
  auto store = CredentialStore::load_first_existing({root / "server" / "credentials.txt", root / "credentials.txt"}, &used);
  ok &= ctx.expect(used == root / "credentials.txt", "falls back to the second candidate");
  ok &= ctx.expect(store.matches("zoe", "z1"), "fallback file loaded");

  filemesh::test::write_file(root / "server" / "credentials.txt", "yan y1\n");
  store = CredentialStore::load_first_existing({root / "server" / "credentials.txt", root / "credentials.txt"}, &used);
  ok &= ctx.expect(used == root / "server" / "credentials.txt", "first candidate preferred");
  ok &= ctx.expect(store.contains("yan") && !store.contains("zoe"), "only the first file is used");
  return ok;
}

bool test_udp_round_trip(TestContext& ctx) {
  auto logger = attached_logger(ctx);
  Coordinator coordinator(sample_credentials(), 3s, logger);
  CoordinatorServer::Options options;
  options.port = 0;
  CoordinatorServer server(coordinator, options, logger);
  server.start_background();

  auto client_logger = std::make_shared<Logger>("control-client");
  ctx.logs.attach(client_logger);
  ControlClient client("127.0.0.1", server.bound_port(), 1000ms, client_logger);

  bool ok = true;
  ok &= ctx.expect(server.bound_port() != 0, "ephemeral port bound");
  ok &= ctx.expect(client.request(make_auth_request("alice", "s1", 7001)) == std::string(kReplyOk), "auth over UDP");
  ok &= ctx.expect(client.request(make_file_request(MessageType::Share, "alice", "a.txt")) == std::string(kReplyShared),
                   "share over UDP");
  ok &= ctx.expect(client.request(make_user_request(MessageType::ListFiles, "alice")) == std::string("1 file shared:\na.txt"),
                   "list files over UDP");

  nlohmann::json unknown = {{"type", "PING"}, {"username", "alice"}};
  ControlClient quick("127.0.0.1", server.bound_port(), 200ms, client_logger);
  ok &= ctx.expect(!quick.request(unknown), "unknown type times out without reply");

  nlohmann::json malformed = {{"type", "FETCH"}, {"username", "alice"}};
  ok &= ctx.expect(client.request(malformed) == std::string(kReplyMalformed), "malformed reply over UDP");
  ok &= ctx.expect(client.request(make_user_request(MessageType::ListPeers, "alice")) == std::string(kReplyNoPeers),
                   "server keeps serving after errors");

  ok &= ctx.expect(client.send(make_status_message("alice")), "heartbeat sent");
  ok &= ctx.expect(filemesh::test::wait_for_condition([&]{ return server.datagrams_handled() >= 7; }, 1000ms),
                   "heartbeat processed");

  server.stop();
  return ok;
}

bool test_reply_timeout_when_coordinator_absent(TestContext& ctx) {
  // Bind and release a port so nothing is listening on it.
  uint16_t port = 0;
  {
    asio::io_context io;
    udp::socket probe(io, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = probe.local_endpoint().port();
  }
  auto logger = std::make_shared<Logger>("control-client");
  ctx.logs.attach(logger);
  ControlClient client("127.0.0.1", port, 300ms, logger);
  const auto start = std::chrono::steady_clock::now();
  auto reply = client.request(make_user_request(MessageType::ListPeers, "alice"));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  bool ok = ctx.expect(!reply, "no reply without a coordinator");
  ok &= ctx.expect(elapsed < 2s, "request gives up within its timeout");
  return ok;
}

std::vector<char*> make_argv(std::vector<std::string>& args) {
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  return argv;
}

bool test_settings_from_command_line(TestContext& ctx) {
  auto root = filemesh::test::prepare_workspace("settings");
  SettingsManager settings(COORDINATOR_SETTINGS_SPECIFICATION, "coordinator.json");
  settings.set_settings_path(root / ".config" / "coordinator.json");
  CommandLineParser parser("filemesh_coordinator", "file mesh coordinator",
                           nlohmann::json::array({{{"index",0},{"key","server_port"}}}));

  bool ok = true;
  ok &= ctx.expect(settings.get<int>("liveness_window_ms") == 3000, "default liveness window");
  ok &= ctx.expect(!settings.load(), "missing settings file is skipped");

  std::vector<std::string> args = {"filemesh_coordinator", "9000", "--liveness", "1500", "-v", "-c", "creds.txt", "--save"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
  ok &= ctx.expect(settings.get_port("server_port") == 9000, "positional port");
  ok &= ctx.expect(settings.get_millis("liveness_window_ms") == std::chrono::milliseconds(1500), "alias sets liveness");
  ok &= ctx.expect(settings.get<bool>("verbose"), "bare flag sets bool");
  ok &= ctx.expect(settings.get<std::string>("credentials_file") == "creds.txt", "short alias with value");
  ok &= ctx.expect(settings.save_requested(), "save requested");

  ok &= ctx.expect(settings.save(), "settings written");
  SettingsManager reloaded(COORDINATOR_SETTINGS_SPECIFICATION, "coordinator.json");
  reloaded.set_settings_path(settings.settings_path());
  ok &= ctx.expect(reloaded.load(), "settings read back");
  ok &= ctx.expect(reloaded.get<int>("server_port") == 9000 && reloaded.get<int>("liveness_window_ms") == 1500,
                   "persistent values restored");
  ok &= ctx.expect(!reloaded.save_requested(), "non-persistent flags not restored");

  auto rejects = [&](std::vector<std::string> bad, const std::string& what) {
    SettingsManager fresh(COORDINATOR_SETTINGS_SPECIFICATION, "coordinator.json");
    auto bad_argv = make_argv(bad);
    try {
      parser.parse(static_cast<int>(bad_argv.size()), bad_argv.data(), fresh);
    } catch(const ConfigError&) {
      return true;
    }
    ctx.logs.note("accepted: " + what);
    return false;
  };
  ok &= ctx.expect(rejects({"x", "--bogus", "1"}, "unknown option"), "unknown option rejected");
  ok &= ctx.expect(rejects({"x", "90a0"}, "non-numeric port"), "non-numeric port rejected");
  ok &= ctx.expect(rejects({"x", "9000", "9001"}, "extra positional"), "extra positional rejected");
  ok &= ctx.expect(rejects({"x", "--liveness"}, "missing value"), "missing value rejected");

  SettingsManager out_of_range(COORDINATOR_SETTINGS_SPECIFICATION, "coordinator.json");
  std::string error;
  ok &= ctx.expect(out_of_range.assign("port", "70000", error), "any integer stored");
  bool threw = false;
  try {
    out_of_range.get_port("server_port");
  } catch(const ConfigError&) {
    threw = true;
  }
  ok &= ctx.expect(threw, "port above 65535 is a config error");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"authenticate_outcomes", test_authenticate_outcomes},
    {"expired_session_is_swept", test_expired_session_is_swept},
    {"late_heartbeat_before_sweep_keeps_session", test_late_heartbeat_before_sweep_keeps_session},
    {"heartbeat_refreshes_and_ignores_unknown", test_heartbeat_refreshes_and_ignores_unknown},
    {"share_is_idempotent", test_share_is_idempotent},
    {"remove_last_sharer_deletes_record", test_remove_last_sharer_deletes_record},
    {"remove_keeps_other_sharers", test_remove_keeps_other_sharers},
    {"search_filters_caller_and_offline", test_search_filters_caller_and_offline},
    {"fetch_picks_smallest_live_sharer", test_fetch_picks_smallest_live_sharer},
    {"fetch_from_expired_sharer_not_found", test_fetch_from_expired_sharer_not_found},
    {"malformed_request_then_valid", test_malformed_request_then_valid},
    {"filename_with_control_characters_rejected", test_filename_with_control_characters_rejected},
    {"unknown_type_dropped", test_unknown_type_dropped},
    {"listing_reply_format", test_listing_reply_format},
    {"transfer_framing_helpers", test_transfer_framing_helpers},
    {"credentials_parsing", test_credentials_parsing},
    {"credentials_file_lookup", test_credentials_file_lookup},
    {"settings_from_command_line", test_settings_from_command_line},
    {"udp_round_trip", test_udp_round_trip},
    {"reply_timeout_when_coordinator_absent", test_reply_timeout_when_coordinator_absent}
  };
  return filemesh::test::run_tests("coordinator", tests, argc, argv);
}
