#include "credential_store.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

CredentialStore CredentialStore::parse(std::istream& in) {
  std::unordered_map<std::string, std::string> entries;
  std::string line;
  std::size_t line_number = 0;
  while(std::getline(in, line)) {
    ++line_number;
    while(!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
    auto first = std::find_if(line.begin(), line.end(),
      [](unsigned char ch){ return !std::isspace(ch); });
    line.erase(line.begin(), first);
    if(line.empty()) continue;

    auto space = line.find(' ');
    if(space == std::string::npos) {
      throw ConfigError("credentials line " + std::to_string(line_number) +
                        " is missing a password");
    }
    entries[line.substr(0, space)] = line.substr(space + 1);
  }
  return CredentialStore(std::move(entries));
}

CredentialStore CredentialStore::load_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to read credentials file " + path.string());
  }
  return parse(in);
}

CredentialStore CredentialStore::load_first_existing(const std::vector<std::filesystem::path>& candidates,
                                                     std::filesystem::path* loaded_from) {
  std::string tried;
  for(const auto& candidate : candidates) {
    std::error_code ec;
    if(std::filesystem::is_regular_file(candidate, ec)) {
      auto store = load_file(candidate);
      if(loaded_from) *loaded_from = candidate;
      return store;
    }
    if(!tried.empty()) tried += ", ";
    tried += candidate.string();
  }
  throw ConfigError("credentials file not found (tried: " + tried + ")");
}

bool CredentialStore::contains(const std::string& username) const {
  return entries_.count(username) > 0;
}

bool CredentialStore::matches(const std::string& username, const std::string& password) const {
  auto it = entries_.find(username);
  return it != entries_.end() && it->second == password;
}

std::vector<std::string> CredentialStore::usernames() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.first);
  std::sort(out.begin(), out.end());
  return out;
}
