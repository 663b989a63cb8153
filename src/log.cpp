#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> log_out;
  std::shared_ptr<spdlog::logger> log_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::once_flag g_sinks_once;
ConsoleSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    spdlog::sink_ptr sink,
                                                    const std::string& pattern,
                                                    spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

const ConsoleSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.log_out = make_console_logger("filemesh.log",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), stamped, spdlog::level::warn);
    g_sinks.log_err = make_console_logger("filemesh.error",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), stamped, spdlog::level::err);
    g_sinks.plain_out = make_console_logger("filemesh.print",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v", spdlog::level::info);
    g_sinks.plain_err = make_console_logger("filemesh.print_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v", spdlog::level::err);
    g_sinks.log_out->set_level(spdlog::level::info);
  });
  return g_sinks;
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return spdlog::level::debug;
    case LogChannel::Info:     return spdlog::level::info;
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:    return spdlog::level::err;
    case LogChannel::Print:    return spdlog::level::info;
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return "debug";
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "unknown";
}

void init_logging(bool verbose) {
  const auto& s = sinks();
  s.log_out->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(s.log_out);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void Logger::set_name(std::string name) {
  std::lock_guard lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lock(mutex_);
  listeners_.clear();
}

bool Logger::notify_listeners(LogChannel channel, const std::string& message) {
  std::string name;
  std::vector<Listener> snapshot;
  {
    std::lock_guard lock(mutex_);
    name = name_;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(name, channel, message)) handled = true;
    } catch(const std::exception& e) {
      detail::write_console(name, LogChannel::Error,
                            fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel, const std::string& message) {
  if(notify_listeners(channel, message)) return;
  detail::write_console(name(), channel, message);
}

namespace detail {

void write_console(const std::string& logger_name,
                   LogChannel channel,
                   const std::string& message) {
  if(!log_passthrough()) return;
  const auto& s = sinks();

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print:    sink = s.plain_out.get(); break;
    case LogChannel::PrintErr: sink = s.plain_err.get(); break;
    case LogChannel::Error:    sink = s.log_err.get(); break;
    default:                   sink = s.log_out.get(); break;
  }

  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(plain || logger_name.empty()) {
    sink->log(level_for(channel), message);
  } else {
    sink->log(level_for(channel), fmt::format("[{}] {}", logger_name, message));
  }
}

} // namespace detail
