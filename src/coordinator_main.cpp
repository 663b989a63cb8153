#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <filesystem>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "coordinator.hpp"
#include "coordinator_server.hpp"
#include "credential_store.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

CredentialStore load_credentials(const SettingsManager& settings, Logger& logger) {
  const auto configured = settings.get<std::string>("credentials_file");
  std::filesystem::path loaded_from;
  CredentialStore store;
  if(configured.empty()) {
    store = CredentialStore::load_first_existing({"server/credentials.txt", "credentials.txt"}, &loaded_from);
  } else {
    loaded_from = configured;
    store = CredentialStore::load_file(loaded_from);
  }
  logger.info("Loaded {} credentials from {}", store.size(), loaded_from.string());
  return store;
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings(COORDINATOR_SETTINGS_SPECIFICATION, "coordinator.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "filemesh_coordinator",
                             "file mesh coordinator",
                             nlohmann::json::array({{{"index",0},{"key","server_port"}}}));
    try {
      parser.parse(argc, argv, settings);
    } catch(const ConfigError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(settings);
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage(settings);
      return 0;
    }
    if(settings.get<int>("server_port") == 0) {
      print_err(nullptr, "server_port is required");
      parser.usage(settings);
      return 1;
    }

    init_logging(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("coordinator");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    Coordinator coordinator(load_credentials(settings, *logger),
                            settings.get_millis("liveness_window_ms"),
                            logger);

    CoordinatorServer::Options options;
    options.bind_ip = settings.get<std::string>("bind_ip");
    options.port = settings.get_port("server_port");
    CoordinatorServer server(coordinator, options, logger);
    server.run();
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("coordinator-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
