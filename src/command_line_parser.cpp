#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include "errors.hpp"
#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(token[1]));
}

std::string strip_dashes(const std::string& token) {
  return token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
}

std::string default_text(const SettingsManager::Entry& entry) {
  const auto& value = entry.default_value;
  if(value.is_string()) {
    const auto text = value.get<std::string>();
    return text.empty() ? "\"\"" : text;
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     const nlohmann::json& positionals)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)) {
  std::map<std::size_t, std::string> ordered;
  for(const auto& item : positionals) {
    ordered[item.at("index").get<std::size_t>()] = item.at("key").get<std::string>();
  }
  for(auto& [index, key] : ordered) {
    if(index != positional_keys_.size()) {
      throw ConfigError("Positional argument indices must be contiguous from 0");
    }
    positional_keys_.push_back(std::move(key));
  }
}

void CommandLineParser::apply(SettingsManager& settings,
                              const std::string& key,
                              const std::string& value,
                              const std::string& shown_as) const {
  std::string error;
  if(!settings.assign(key, value, error)) {
    throw ConfigError("Invalid " + shown_as + ": " + error);
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  for(const auto& key : positional_keys_) {
    if(!settings.find(key)) {
      throw ConfigError("Positional argument maps to unknown setting '" + key + "'");
    }
  }

  std::vector<std::string> args;
  if(argv && argc > 1) args.assign(argv + 1, argv + argc);

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(looks_like_option(token)) {
      const std::string name = strip_dashes(token);
      const auto* entry = settings.find(name);
      if(!entry) {
        throw ConfigError("Unknown option " + token);
      }
      if(entry->type == SettingType::Bool) {
        // A bool option takes the next token only when it reads as a bool.
        const bool has_value = i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1]);
        apply(settings, entry->key, has_value ? args[++i] : "true", "option " + token);
        continue;
      }
      if(i + 1 >= args.size()) {
        throw ConfigError("Option " + token + " needs a value");
      }
      apply(settings, entry->key, args[++i], "option " + token);
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      throw ConfigError("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_keys_[next_positional++];
    apply(settings, key, token, "<" + key + ">");
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) {
    synopsis += " <" + key + ">";
  }
  synopsis += " [options]";

  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage: {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings.entries()) {
    std::string flags = "--" + entry.key;
    for(const auto& alias : entry.aliases) {
      flags += ", -" + alias;
    }
    const std::string value_hint = entry.type == SettingType::Bool
      ? "[on|off]"
      : "<" + std::string(to_string(entry.type)) + ">";
    print_out(nullptr, "  {} {}", flags, value_hint);
    print_out(nullptr, "      {} (default: {})", entry.description, default_text(entry));
  }
}
