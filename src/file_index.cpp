#include "file_index.hpp"

#include <algorithm>

void FileIndex::share(const std::string& filename, const std::string& username){
    records_[filename].insert(username);
}

bool FileIndex::remove(const std::string& filename, const std::string& username){
    auto it = records_.find(filename);
    if(it == records_.end()) return false;
    if(it->second.erase(username) == 0) return false;
    if(it->second.empty()) records_.erase(it);
    return true;
}

bool FileIndex::has(const std::string& filename) const {
    return records_.count(filename) > 0;
}

std::set<std::string> FileIndex::sharers(const std::string& filename) const {
    auto it = records_.find(filename);
    if(it == records_.end()) return {};
    return it->second;
}

std::vector<std::string> FileIndex::files_shared_by(const std::string& username) const {
    std::vector<std::string> out;
    for(const auto& record : records_){
        if(record.second.count(username)) out.push_back(record.first);
    }
    return out;
}

std::vector<std::string> FileIndex::search(const std::string& pattern, const SharerFilter& filter) const {
    std::vector<std::string> out;
    for(const auto& record : records_){
        if(record.first.find(pattern) == std::string::npos) continue;
        if(std::any_of(record.second.begin(), record.second.end(), filter)){
            out.push_back(record.first);
        }
    }
    return out;
}

std::optional<std::string> FileIndex::first_sharer(const std::string& filename,
                                                   const SharerFilter& filter) const {
    auto it = records_.find(filename);
    if(it == records_.end()) return std::nullopt;
    auto match = std::find_if(it->second.begin(), it->second.end(), filter);
    if(match == it->second.end()) return std::nullopt;
    return *match;
}
