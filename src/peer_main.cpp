#include <cpptrace/cpptrace.hpp>

#include <filesystem>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "peer_agent.hpp"
#include "peer_cli.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings(PEER_SETTINGS_SPECIFICATION, "peer.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "filemesh_peer",
                             "file mesh peer",
                             nlohmann::json::array({
                               {{"index",0},{"key","server_port"}},
                               {{"index",1},{"key","server_ip"}}
                             }));
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
    auto logger = std::make_shared<Logger>("peer");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    PeerAgent::Options options;
    options.server_ip = settings.get<std::string>("server_ip");
    options.server_port = settings.get_port("server_port");
    options.transfer_ip = settings.get<std::string>("transfer_ip");
    const auto workspace = settings.get<std::string>("workspace");
    options.workspace_root = workspace.empty() ? std::filesystem::current_path()
                                               : std::filesystem::path(workspace);
    options.heartbeat_interval = settings.get_millis("heartbeat_interval_ms");
    options.request_timeout = settings.get_millis("request_timeout_ms");
    options.connect_timeout = settings.get_millis("connect_timeout_ms");
    options.transfer_read_timeout = settings.get_millis("transfer_read_timeout_ms");
    options.transfer_debug = settings.get<bool>("transfer_debug");

    PeerAgent agent(options);
    agent.start();

    PeerCLI cli(agent, logger);
    cli.set_transfer_progress(settings.get<bool>("transfer_progress"));
    if(cli.login()) {
      cli.print_help();
      cli.run_loop();
    }
    agent.stop();
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("peer-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
