#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "peer_agent.hpp"

// Interactive front end: login prompt, then one command per line. All text
// shown to the user is produced here.
class PeerCLI {
public:
  // With input == nullptr lines come from readline (or std::cin).
  PeerCLI(PeerAgent& agent,
          std::shared_ptr<Logger> output,
          std::istream* input = nullptr);

  // Prompts until the coordinator accepts the credentials. False on end of input.
  bool login();
  void run_loop();
  // False once the user asked to quit.
  bool execute_command(const std::string& line);

  void print_help();

  void set_transfer_progress(bool enabled) { transfer_progress_ = enabled; }

private:
  std::optional<std::string> read_line(const char* prompt);

  void render_reply(const ControlReply& reply);
  void fetch(const std::string& filename);
  void render_fetch(const std::string& filename, const FetchOutcome& outcome);
  void render_failure(const ControlReply& reply);

  PeerAgent& agent_;
  std::shared_ptr<Logger> out_;
  std::istream* input_;
  bool transfer_progress_ = true;
};
