#include "command.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

emberkv::Reply run(emberkv::CommandContext& ctx, const std::vector<std::string>& args) {
  return emberkv::handle_command(args, ctx);
}

}  // namespace

int main() {
  emberkv::set_log_level(emberkv::LogLevel::Error);

  if (emberkv::encode_reply(emberkv::Reply::error("WRONGTYPE", emberkv::wrongtype_error_message())) !=
      "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n") {
    std::cerr << "wrongtype error text mismatch\n";
    return 1;
  }

  emberkv::DataStore store;
  emberkv::BlockingCoordinator blocking;
  emberkv::SessionState session;
  emberkv::CommandContext ctx{store, blocking, session};

  run(ctx, {"SET", "s", "v"});
  run(ctx, {"RPUSH", "l", "a"});
  run(ctx, {"XADD", "x", "1-1", "f", "v"});

  // Every typed command against every other type is rejected before it runs.
  const std::vector<std::vector<std::string>> against_string = {
      {"LPUSH", "s", "x"}, {"RPUSH", "s", "x"}, {"LLEN", "s"},       {"LRANGE", "s", "0", "-1"},
      {"LPOP", "s"},       {"BLPOP", "s", "0"}, {"XADD", "s", "*", "f", "v"}, {"XRANGE", "s", "-", "+"},
      {"XLEN", "s"},
  };
  const std::vector<std::vector<std::string>> against_list = {
      {"GET", "l"}, {"INCR", "l"}, {"XADD", "l", "*", "f", "v"}, {"XRANGE", "l", "-", "+"}, {"XLEN", "l"},
  };
  const std::vector<std::vector<std::string>> against_stream = {
      {"GET", "x"}, {"INCR", "x"}, {"RPUSH", "x", "y"}, {"LLEN", "x"}, {"LPOP", "x"}, {"BLPOP", "x", "0"},
  };

  for (const auto* group : {&against_string, &against_list, &against_stream}) {
    for (const auto& args : *group) {
      const auto reply = run(ctx, args);
      if (reply.error_kind() != "WRONGTYPE") {
        std::cerr << args[0] << " " << args[1] << " should be WRONGTYPE, got " << reply.text << "\n";
        return 1;
      }
    }
  }

  if (blocking.blocked_clients() != 0 || session.blocked.active) {
    std::cerr << "WRONGTYPE BLPOP must not block\n";
    return 1;
  }

  bool wrongtype = false;
  if (store.get("s", wrongtype) != std::optional<std::string>("v") || store.llen("l", wrongtype) != 1 ||
      store.xlen("x", wrongtype) != 1) {
    std::cerr << "failed commands must not modify values\n";
    return 1;
  }

  // Untyped commands work on any key.
  for (const std::string key : {"s", "l", "x"}) {
    if (run(ctx, {"EXISTS", key}).integer != 1 || run(ctx, {"TYPE", key}).is_error()) {
      std::cerr << "untyped command failed on " << key << "\n";
      return 1;
    }
  }

  // SET replaces a value of any type.
  if (run(ctx, {"SET", "l", "now-a-string"}).text != "OK" || store.type_of("l") != "string") {
    std::cerr << "SET should replace a list\n";
    return 1;
  }

  std::cout << "wrongtype_framework_test passed\n";
  return 0;
}
