#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Output channels. Log channels carry timestamps and levels; the two print
// channels are plain text meant for the person at the terminal.
enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,
  PrintErr
};

const char* to_string(LogChannel channel);

void init_logging(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true from a listener marks the line as handled and suppresses
  // the console sink for it.
  using Listener = std::function<bool(const std::string& logger_name,
                                      LogChannel channel,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void emit(LogChannel channel, const std::string& message);
  bool notify_listeners(LogChannel channel, const std::string& message);

  mutable std::mutex mutex_;
  std::string name_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void write_console(const std::string& logger_name,
                   LogChannel channel,
                   const std::string& message);
} // namespace detail

// Free helpers for code paths that may run without a component logger.
template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console("", LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::write_console("", LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }
}
