#pragma once
#include <asio.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string& data);
// Streams the file through SHA-256; nullopt when it cannot be read.
std::optional<std::string> sha256_file_hex(const std::filesystem::path& path);

template<typename Endpoint>
std::string endpoint_to_string(const Endpoint& endpoint) {
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

std::string trim_copy(std::string value);
