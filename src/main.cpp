#include "config.hpp"
#include "logger.hpp"
#include "server.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace {

void on_terminate_signal(int) { emberkv::request_shutdown(); }

void print_usage() {
  std::cout << "Usage: emberkv-server [--port <port>] [--bind <ip>] [--loglevel <error|warn|info|debug>] "
               "[--debug] [--config <path>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, on_terminate_signal);
  std::signal(SIGTERM, on_terminate_signal);

  std::string config_path;
  std::string port_arg;
  std::string bind_arg;
  std::string level_arg;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--debug") {
      level_arg = "debug";
      continue;
    }
    if (i + 1 < argc) {
      if (arg == "--config") {
        config_path = argv[++i];
        continue;
      }
      if (arg == "--port") {
        port_arg = argv[++i];
        continue;
      }
      if (arg == "--bind") {
        bind_arg = argv[++i];
        continue;
      }
      if (arg == "--loglevel") {
        level_arg = argv[++i];
        continue;
      }
    }
    std::cerr << "unknown or incomplete option: " << arg << "\n";
    print_usage();
    return 1;
  }

  // File settings first, command-line flags on top.
  emberkv::ServerConfig config = emberkv::load_config(config_path);
  if (!port_arg.empty() && !emberkv::parse_port(port_arg, config.port)) {
    emberkv::log(emberkv::LogLevel::Error, "invalid port: " + port_arg);
    return 1;
  }
  if (!bind_arg.empty()) config.bind = bind_arg;
  if (!level_arg.empty()) config.log_level = level_arg;

  emberkv::set_log_level(emberkv::parse_log_level(config.log_level));
  emberkv::log(emberkv::LogLevel::Info, "starting emberkv-server");

  return emberkv::run_server(config);
}
