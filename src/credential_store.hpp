#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

// username -> secret, loaded once at startup and never modified afterwards.
class CredentialStore {
public:
  CredentialStore() = default;
  explicit CredentialStore(std::unordered_map<std::string, std::string> entries)
    : entries_(std::move(entries)) {}

  // Lines are "username password"; the password is the remainder of the
  // line with trailing whitespace removed. Blank lines are skipped.
  static CredentialStore parse(std::istream& in);

  // Throws ConfigError when the file is missing or unreadable.
  static CredentialStore load_file(const std::filesystem::path& path);

  // Tries each candidate in order; throws ConfigError naming all of them
  // when none exists.
  static CredentialStore load_first_existing(const std::vector<std::filesystem::path>& candidates,
                                             std::filesystem::path* loaded_from = nullptr);

  bool contains(const std::string& username) const;
  bool matches(const std::string& username, const std::string& password) const;
  std::vector<std::string> usernames() const;
  std::size_t size() const { return entries_.size(); }

private:
  std::unordered_map<std::string, std::string> entries_;
};
