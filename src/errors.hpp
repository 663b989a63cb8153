#pragma once

#include <stdexcept>
#include <string>

enum class AuthError {
  None,
  AlreadyActive,
  UnknownUser,
  BadPassword,
  Timeout,
  Rejected
};

enum class TransferError {
  None,
  NotFound,
  ConnectTimeout,
  ConnectionRefused,
  ConnectFailed,
  Timeout,
  Truncated,
  BadSizeToken,
  LocalWriteFailed
};

inline const char* to_string(AuthError error) {
  switch(error) {
    case AuthError::None:          return "OK";
    case AuthError::AlreadyActive: return "User already logged in";
    case AuthError::UnknownUser:   return "Username not found";
    case AuthError::BadPassword:   return "Incorrect password";
    case AuthError::Timeout:       return "Coordinator did not respond";
    case AuthError::Rejected:      return "Authentication rejected";
  }
  return "Unknown authentication error";
}

inline const char* to_string(TransferError error) {
  switch(error) {
    case TransferError::None:              return "Transfer complete";
    case TransferError::NotFound:          return "Peer does not have the file";
    case TransferError::ConnectTimeout:    return "Timed out connecting to peer";
    case TransferError::ConnectionRefused: return "Connection refused by peer";
    case TransferError::ConnectFailed:     return "Could not connect to peer";
    case TransferError::Timeout:           return "Timed out waiting for peer";
    case TransferError::Truncated:         return "Connection closed before the whole file arrived";
    case TransferError::BadSizeToken:      return "Invalid file size received";
    case TransferError::LocalWriteFailed:  return "Could not write the downloaded file";
  }
  return "Unknown transfer error";
}

// Startup configuration problems. Only thrown before the components start.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};
