#pragma once

#include <string>

namespace emberkv {

enum class LogLevel {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
};

void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& level);
bool log_enabled(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace emberkv
