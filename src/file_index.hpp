#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// filename -> sharer usernames. A record never exists with an empty sharer
// set. Not synchronized; the coordinator loop is the only user.
class FileIndex {
public:
  using SharerFilter = std::function<bool(const std::string& username)>;

  // Idempotent.
  void share(const std::string& filename, const std::string& username);
  // True when username was a sharer before the call.
  bool remove(const std::string& filename, const std::string& username);

  bool has(const std::string& filename) const;
  std::set<std::string> sharers(const std::string& filename) const;
  std::vector<std::string> files_shared_by(const std::string& username) const;

  // Filenames containing pattern with at least one sharer accepted by filter.
  std::vector<std::string> search(const std::string& pattern, const SharerFilter& filter) const;

  // Smallest (lexicographic) sharer of filename accepted by filter.
  std::optional<std::string> first_sharer(const std::string& filename,
                                          const SharerFilter& filter) const;

  std::size_t size() const { return records_.size(); }

private:
  std::map<std::string, std::set<std::string>> records_;
};
