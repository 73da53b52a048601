#pragma once

#include "blocking.hpp"
#include "datastore.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberkv {

struct BlockedState {
  bool active = false;
  std::string key;
  std::int64_t deadline_ms = 0;  // 0 = infinite
};

struct SessionState {
  std::uint64_t client_id = 0;
  RequestDecoder decoder;
  BlockedState blocked;
  bool should_close = false;
  std::string current_command;
  std::uint64_t commands_processed = 0;
};

// Everything a handler may touch. The store and the coordinator belong to
// the scheduling context; nothing reaches them through globals.
struct CommandContext {
  DataStore& store;
  BlockingCoordinator& blocking;
  SessionState& session;
};

using CommandHandler = std::function<Reply(const std::vector<std::string>&, CommandContext&)>;

struct CommandSpec {
  std::string name;
  int min_args;  // arguments after the command name
  int max_args;  // -1 = unbounded
  std::vector<std::string> flags;
  // Type the first key must hold, if it exists. Checked before the handler runs.
  std::optional<ValueType> key_type;
  CommandHandler handler;

  bool is_write() const;
  bool accepts(std::size_t argc) const;
};

const std::unordered_map<std::string, CommandSpec>& command_table();
const CommandSpec* find_command(const std::string& name);

// Runs one request. Command errors come back as error replies; a None reply
// means the client is now suspended or the connection is going away.
Reply handle_command(const std::vector<std::string>& args, CommandContext& ctx);

} // namespace emberkv
