#pragma once

#include <string>
#include <unordered_map>

namespace emberkv {

struct ServerConfig {
  int port = 6379;
  int maxclients = 10000;
  std::string bind = "127.0.0.1";
  std::string log_level = "info";
  std::unordered_map<std::string, std::string> raw;
};

// Reads a redis.conf-style file. A missing file yields the defaults.
ServerConfig load_config(const std::string& path);

// Parses a TCP port in 1..65535. Returns false for anything else.
bool parse_port(const std::string& text, int& out);

} // namespace emberkv
