#include "config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace emberkv {
namespace {

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end()) return "";
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return std::string(first, last);
}

bool parse_int(const std::string& text, int& out) {
  const char* begin = text.data();
  const char* end = begin + text.size();
  int value = 0;
  const auto res = std::from_chars(begin, end, value);
  if (res.ec != std::errc() || res.ptr != end) return false;
  out = value;
  return true;
}

}  // namespace

bool parse_port(const std::string& text, int& out) {
  int value = 0;
  if (!parse_int(text, value) || value < 1 || value > 65535) return false;
  out = value;
  return true;
}

ServerConfig load_config(const std::string& path) {
  ServerConfig cfg;
  if (path.empty()) return cfg;

  std::ifstream in(path);
  if (!in.is_open()) {
    log(LogLevel::Warn, "config file not found: " + path + ", using defaults");
    return cfg;
  }

  std::string line;
  while (std::getline(in, line)) {
    const auto no_comment = line.substr(0, line.find('#'));
    const auto cleaned = trim(no_comment);
    if (cleaned.empty()) continue;

    std::istringstream iss(cleaned);
    std::string key;
    if (!(iss >> key)) continue;

    std::string value;
    std::getline(iss, value);
    value = trim(value);
    if (value.empty()) continue;

    cfg.raw[key] = value;

    if (key == "port") {
      if (!parse_port(value, cfg.port)) {
        log(LogLevel::Warn, "ignoring invalid port in config: " + value);
      }
    } else if (key == "maxclients") {
      int n = 0;
      if (parse_int(value, n) && n > 0) {
        cfg.maxclients = n;
      } else {
        log(LogLevel::Warn, "ignoring invalid maxclients in config: " + value);
      }
    } else if (key == "bind") {
      cfg.bind = value;
    } else if (key == "loglevel") {
      cfg.log_level = value;
    }
  }

  return cfg;
}

}  // namespace emberkv
