#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

// Settings layouts. Each entry: key, aliases (for -x / --x), type
// (bool|int|string), default, description, persistent (written by --save).

inline const nlohmann::json COORDINATOR_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_port"},        {"aliases", {"port","p"}},        {"type","int"},    {"default",0},           {"description","UDP port for control requests (required)"}, {"persistent", true}},
  {{"key","bind_ip"},            {"aliases", {"ip","bind"}},       {"type","string"}, {"default","127.0.0.1"}, {"description","Address the control socket binds to"}, {"persistent", true}},
  {{"key","credentials_file"},   {"aliases", {"credentials","c"}}, {"type","string"}, {"default",""},          {"description","Credentials file (empty: server/credentials.txt, then credentials.txt)"}, {"persistent", true}},
  {{"key","liveness_window_ms"}, {"aliases", {"liveness","lw"}},   {"type","int"},    {"default",3000},        {"description","Heartbeat age after which a session expires"}, {"persistent", true}},
  {{"key","verbose"},            {"aliases", {"v"}},               {"type","bool"},   {"default",false},       {"description","Debug level logging"}, {"persistent", true}},
  {{"key","help"},               {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},       {"description","Show this help and exit"}, {"persistent", false}},
  {{"key","save"},               {"aliases", {"persist"}},         {"type","bool"},   {"default",false},       {"description","Write the effective settings to .config/"}, {"persistent", false}}
});

inline const nlohmann::json PEER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_port"},              {"aliases", {"port","p"}},      {"type","int"},    {"default",0},           {"description","Coordinator UDP port (required)"}, {"persistent", true}},
  {{"key","server_ip"},                {"aliases", {"server","s"}},    {"type","string"}, {"default","127.0.0.1"}, {"description","Coordinator address"}, {"persistent", true}},
  {{"key","transfer_ip"},              {"aliases", {"ti"}},            {"type","string"}, {"default","127.0.0.1"}, {"description","Address the transfer listener binds to"}, {"persistent", true}},
  {{"key","workspace"},                {"aliases", {"w","dir"}},       {"type","string"}, {"default",""},          {"description","Root of the per-user directories (empty: current directory)"}, {"persistent", true}},
  {{"key","heartbeat_interval_ms"},    {"aliases", {"heartbeat","hb"}},{"type","int"},    {"default",2000},        {"description","Milliseconds between STATUS messages"}, {"persistent", true}},
  {{"key","request_timeout_ms"},       {"aliases", {"rt"}},            {"type","int"},    {"default",5000},        {"description","Milliseconds to wait for a coordinator reply"}, {"persistent", true}},
  {{"key","connect_timeout_ms"},       {"aliases", {"ct"}},            {"type","int"},    {"default",10000},       {"description","Milliseconds to connect to and read from a sharing peer"}, {"persistent", true}},
  {{"key","transfer_read_timeout_ms"}, {"aliases", {"trt"}},           {"type","int"},    {"default",5000},        {"description","Milliseconds an inbound transfer may stall"}, {"persistent", true}},
  {{"key","transfer_debug"},           {"aliases", {"td"}},            {"type","bool"},   {"default",false},       {"description","Log SHA-256 digests of files sent and received"}, {"persistent", true}},
  {{"key","transfer_progress"},        {"aliases", {"tp"}},            {"type","bool"},   {"default",true},        {"description","Print download progress during fetch"}, {"persistent", true}},
  {{"key","verbose"},                  {"aliases", {"v"}},             {"type","bool"},   {"default",false},       {"description","Debug level logging"}, {"persistent", true}},
  {{"key","help"},                     {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},       {"description","Show this help and exit"}, {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},       {"type","bool"},   {"default",false},       {"description","Write the effective settings to .config/"}, {"persistent", false}}
});

enum class SettingType {
  Bool,
  Int,
  String
};

const char* to_string(SettingType type);

// Typed key/value settings built from a layout above. Values come from the
// layout defaults, then .config/<file_name>, then the command line.
class SettingsManager {
public:
  struct Entry {
    std::string key;
    std::vector<std::string> aliases;
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  // Throws ConfigError when the layout itself is malformed.
  SettingsManager(const nlohmann::json& layout, std::string file_name);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw ConfigError("Unknown setting '" + key + "'");
    }
    return it->get<T>();
  }

  // Throws ConfigError outside 1..65535 (0 is accepted with allow_zero).
  uint16_t get_port(const std::string& key, bool allow_zero = false) const;
  // Throws ConfigError unless positive.
  std::chrono::milliseconds get_millis(const std::string& key) const;

  // Converts text (from the command line) to the entry's type and stores it.
  bool assign(const std::string& key_or_alias, const std::string& text, std::string& error);

  // Missing file is not an error. Entries that do not convert are reported
  // and skipped.
  bool load();
  bool save() const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  // Case-insensitive lookup by key or alias.
  const Entry* find(const std::string& key_or_alias) const;
  const std::vector<Entry>& entries() const { return entries_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(std::filesystem::path path) { path_override_ = std::move(path); }

  nlohmann::json persistent_values() const;

  static bool is_bool_literal(const std::string& text);

private:
  bool store(const Entry& entry, const nlohmann::json& value, std::string& error);

  std::vector<Entry> entries_;
  nlohmann::json values_;
  std::string file_name_;
  std::filesystem::path path_override_;
};
