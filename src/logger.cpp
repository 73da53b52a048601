#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace emberkv {
namespace {

constexpr const char* kLevelNames[] = {"ERROR", "WARN", "INFO", "DEBUG"};

std::mutex g_log_mutex;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

// "2026-10-17 09:41:07.052"
std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto secs = system_clock::to_time_t(now);
  const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf {};
  localtime_r(&secs, &tm_buf);

  char date[32];
  const std::size_t n = std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  char out[48];
  std::snprintf(out, sizeof(out), "%.*s.%03d", static_cast<int>(n), date, static_cast<int>(millis));
  return out;
}

}  // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

// Accepts the redis.conf spellings too.
LogLevel parse_log_level(const std::string& level) {
  if (level == "error") return LogLevel::Error;
  if (level == "warn" || level == "warning") return LogLevel::Warn;
  if (level == "debug" || level == "verbose") return LogLevel::Debug;
  return LogLevel::Info;
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) <= g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, const std::string& message) {
  if (!log_enabled(level)) return;

  std::string line = "[" + timestamp() + "] [" + kLevelNames[static_cast<int>(level)] + "] ";
  line += message;
  line += '\n';

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << line;
}

}  // namespace emberkv
