#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager: positional arguments by index, then
// "--key value", "-alias value", and bare "--flag" for bool settings.
class CommandLineParser {
public:
  // positionals: [{"index":0,"key":"server_port"}, ...]
  CommandLineParser(std::string process_name,
                    std::string summary,
                    const nlohmann::json& positionals);

  // Throws ConfigError describing the first bad argument.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  void apply(SettingsManager& settings,
             const std::string& key,
             const std::string& value,
             const std::string& shown_as) const;

  std::string process_name_;
  std::string summary_;
  std::vector<std::string> positional_keys_;
};
