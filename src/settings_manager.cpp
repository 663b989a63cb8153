#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

SettingType parse_type(const std::string& key, const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "string") return SettingType::String;
  throw ConfigError("Setting '" + key + "' has unsupported type '" + name + "'");
}

std::optional<bool> parse_bool(const std::string& text) {
  const auto v = lowercase(trim_copy(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

const char* to_string(SettingType type) {
  switch(type) {
    case SettingType::Bool:   return "bool";
    case SettingType::Int:    return "int";
    case SettingType::String: return "string";
  }
  return "?";
}

SettingsManager::SettingsManager(const nlohmann::json& layout, std::string file_name)
  : values_(nlohmann::json::object()),
    file_name_(std::move(file_name)) {
  if(!layout.is_array()) {
    throw ConfigError("Settings layout must be an array");
  }
  for(const auto& item : layout) {
    Entry entry;
    try {
      entry.key = item.at("key").get<std::string>();
      entry.type = parse_type(entry.key, item.at("type").get<std::string>());
      entry.default_value = item.at("default");
      for(const auto& alias : item.value("aliases", std::vector<std::string>{})) {
        entry.aliases.push_back(lowercase(alias));
      }
      entry.description = item.value("description", "");
      entry.persistent = item.value("persistent", true);
    } catch(const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Malformed settings layout entry: ") + e.what());
    }
    values_[entry.key] = entry.default_value;
    entries_.push_back(std::move(entry));
  }
}

const SettingsManager::Entry* SettingsManager::find(const std::string& key_or_alias) const {
  const auto wanted = lowercase(key_or_alias);
  for(const auto& entry : entries_) {
    if(lowercase(entry.key) == wanted) return &entry;
    if(std::find(entry.aliases.begin(), entry.aliases.end(), wanted) != entry.aliases.end()) {
      return &entry;
    }
  }
  return nullptr;
}

bool SettingsManager::store(const Entry& entry, const nlohmann::json& value, std::string& error) {
  switch(entry.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        values_[entry.key] = value.get<bool>();
        return true;
      }
      error = "expected a boolean";
      return false;
    case SettingType::Int:
      if(value.is_number_integer()) {
        values_[entry.key] = value.get<int>();
        return true;
      }
      error = "expected an integer";
      return false;
    case SettingType::String:
      if(value.is_string()) {
        values_[entry.key] = value.get<std::string>();
        return true;
      }
      error = "expected a string";
      return false;
  }
  error = "unsupported type";
  return false;
}

bool SettingsManager::assign(const std::string& key_or_alias, const std::string& text, std::string& error) {
  error.clear();
  const Entry* entry = find(key_or_alias);
  if(!entry) {
    error = "unknown setting '" + key_or_alias + "'";
    return false;
  }

  const std::string clean = trim_copy(text);
  switch(entry->type) {
    case SettingType::Bool: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected true|false|on|off, got '" + clean + "'";
        return false;
      }
      return store(*entry, *parsed, error);
    }
    case SettingType::Int: {
      std::size_t used = 0;
      int parsed = 0;
      try {
        parsed = std::stoi(clean, &used);
      } catch(const std::exception&) {
        error = "'" + clean + "' is not an integer";
        return false;
      }
      if(used != clean.size()) {
        error = "'" + clean + "' is not an integer";
        return false;
      }
      return store(*entry, parsed, error);
    }
    case SettingType::String:
      return store(*entry, clean, error);
  }
  error = "unsupported type";
  return false;
}

uint16_t SettingsManager::get_port(const std::string& key, bool allow_zero) const {
  const int value = get<int>(key);
  if(value < (allow_zero ? 0 : 1) || value > 65535) {
    throw ConfigError(key + " must be between " + (allow_zero ? "0" : "1") +
                      " and 65535, got " + std::to_string(value));
  }
  return static_cast<uint16_t>(value);
}

std::chrono::milliseconds SettingsManager::get_millis(const std::string& key) const {
  const int value = get<int>(key);
  if(value <= 0) {
    throw ConfigError(key + " must be positive, got " + std::to_string(value));
  }
  return std::chrono::milliseconds(value);
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / file_name_;
}

bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const Entry* entry = find(item.key());
    if(!entry) continue;
    std::string error;
    if(!store(*entry, item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) return false;
  out << persistent_values().dump(2) << "\n";
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::persistent_values() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(entry.persistent) doc[entry.key] = values_.at(entry.key);
  }
  return doc;
}

bool SettingsManager::is_bool_literal(const std::string& text) {
  return parse_bool(text).has_value();
}
