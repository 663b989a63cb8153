#include "peer_cli.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "utils.hpp"

PeerCLI::PeerCLI(PeerAgent& agent,
                 std::shared_ptr<Logger> output,
                 std::istream* input)
  : agent_(agent),
    out_(output ? std::move(output) : std::make_shared<Logger>("cli")),
    input_(input) {}

std::optional<std::string> PeerCLI::read_line(const char* prompt) {
  if(input_) {
    std::string line;
    if(!std::getline(*input_, line)) return std::nullopt;
    return line;
  }
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

bool PeerCLI::login() {
  for(;;) {
    auto username = read_line("Username: ");
    if(!username) return false;
    auto password = read_line("Password: ");
    if(!password) return false;

    const auto name = trim_copy(*username);
    if(name.empty()) {
      out_->print_err("Username must not be empty");
      continue;
    }
    auto outcome = agent_.authenticate(name, *password);
    if(outcome.ok()) {
      out_->print("Logged in as {}", name);
      return true;
    }
    if(outcome.error == AuthError::Timeout) {
      out_->print_err("{}", to_string(outcome.error));
    } else {
      out_->print_err("{}", outcome.reply.empty() ? to_string(outcome.error) : outcome.reply);
    }
  }
}

void PeerCLI::run_loop() {
  for(;;) {
    auto input = read_line("> ");
    if(!input) break;
    if(!execute_command(*input)) break;
  }
}

bool PeerCLI::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  std::string arg;
  std::getline(iss, arg);
  arg = trim_copy(arg);

  auto require_arg = [&](const char* usage){
    if(arg.empty()) {
      out_->print_err("Usage: {}", usage);
      return false;
    }
    return true;
  };

  if(cmd == "peers") {
    render_reply(agent_.list_peers());
  } else if(cmd == "myfiles") {
    render_reply(agent_.list_files());
  } else if(cmd == "share") {
    if(require_arg("share <filename>")) render_reply(agent_.share(arg));
  } else if(cmd == "find") {
    if(require_arg("find <pattern>")) render_reply(agent_.search(arg));
  } else if(cmd == "remove") {
    if(require_arg("remove <filename>")) render_reply(agent_.remove(arg));
  } else if(cmd == "fetch") {
    if(require_arg("fetch <filename>")) fetch(arg);
  } else if(cmd == "help" || cmd == "h" || cmd == "?") {
    print_help();
  } else if(cmd == "quit" || cmd == "exit") {
    out_->print("Goodbye!");
    return false;
  } else {
    print_help();
    out_->print_err("Unknown command: {}", cmd);
  }
  return true;
}

void PeerCLI::print_help() {
  out_->print("Available commands:");
  out_->print("  peers               List other online peers");
  out_->print("  myfiles             List the files you share");
  out_->print("  share <filename>    Share a file from your directory");
  out_->print("  find <pattern>      Search files shared by online peers");
  out_->print("  remove <filename>   Stop sharing a file");
  out_->print("  fetch <filename>    Download a file from a peer");
  out_->print("  help|h|?            Show this help message");
  out_->print("  quit                Sign out and exit");
}

void PeerCLI::render_failure(const ControlReply& reply) {
  switch(reply.status) {
    case ControlReply::Status::Timeout:
      out_->print_err("Coordinator did not respond");
      break;
    case ControlReply::Status::NotAuthenticated:
      out_->print_err("Not logged in");
      break;
    default:
      out_->print_err("{}", reply.message);
      break;
  }
}

void PeerCLI::render_reply(const ControlReply& reply) {
  if(!reply.ok()) {
    render_failure(reply);
    return;
  }
  out_->print("{}", reply.message);
}

void PeerCLI::fetch(const std::string& filename) {
  if(!transfer_progress_) {
    render_fetch(filename, agent_.fetch(filename));
    return;
  }
  // One line per tenth of the file, then one at completion.
  int shown = -1;
  auto meter = [this, &shown](uint64_t received, uint64_t expected) {
    const int percent = expected == 0 ? 100 : static_cast<int>(received * 100 / expected);
    const int step = percent == 100 ? 10 : percent / 10;
    if(step == shown) return;
    shown = step;
    out_->print("Download progress: {}%", percent);
  };
  render_fetch(filename, agent_.fetch(filename, meter));
}

void PeerCLI::render_fetch(const std::string& filename, const FetchOutcome& outcome) {
  if(!outcome.lookup.ok()) {
    render_failure(outcome.lookup);
    return;
  }
  if(!outcome.transfer.ok()) {
    out_->print_err("{}: {}", to_string(outcome.transfer.error), outcome.transfer.detail);
    return;
  }
  out_->print("Downloaded {} ({} bytes) from {}",
              filename, outcome.transfer.received_bytes, outcome.target->username);
}
