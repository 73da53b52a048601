#include "command.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "server.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberkv {
namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

Reply ok_reply() { return Reply::status("OK"); }
Reply error_reply(const std::string& message) { return Reply::error("ERR", message); }
Reply wrongtype_reply() { return Reply::error("WRONGTYPE", wrongtype_error_message()); }

bool parse_i64(const std::string& s, std::int64_t& out) {
  const char* first = s.data();
  const char* last = first + s.size();
  const auto res = std::from_chars(first, last, out);
  return !s.empty() && res.ec == std::errc() && res.ptr == last;
}

std::int64_t integer_arg(const std::string& s) {
  std::int64_t out = 0;
  if (!parse_i64(s, out)) throw CommandError("ERR", "value is not an integer or out of range");
  return out;
}

std::size_t count_arg(const std::string& s) {
  const std::int64_t n = integer_arg(s);
  if (n < 0) throw CommandError("ERR", "value is out of range, must be positive");
  return static_cast<std::size_t>(n);
}

// BLPOP timeout in seconds, fractions allowed. Returns milliseconds.
std::int64_t timeout_arg(const std::string& s) {
  errno = 0;
  char* end = nullptr;
  const double seconds = std::strtod(s.c_str(), &end);
  if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(seconds)) {
    throw CommandError("ERR", "timeout is not a float or out of range");
  }
  if (seconds < 0) throw CommandError("ERR", "timeout is negative");
  const double ms = std::ceil(seconds * 1000.0);
  if (ms > 1e15) throw CommandError("ERR", "timeout is not a float or out of range");
  return static_cast<std::int64_t>(ms);
}

StreamId range_start_arg(const std::string& s) {
  StreamId id;
  if (!parse_range_start(s, id)) throw CommandError("ERR", "Invalid stream ID specified as stream command argument");
  return id;
}

StreamId range_end_arg(const std::string& s) {
  StreamId id;
  if (!parse_range_end(s, id)) throw CommandError("ERR", "Invalid stream ID specified as stream command argument");
  return id;
}

Reply stream_entry_reply(const StreamEntry& entry) {
  std::vector<Reply> fv;
  fv.reserve(entry.fields.size() * 2);
  for (const auto& [field, value] : entry.fields) {
    fv.push_back(Reply::bulk(field));
    fv.push_back(Reply::bulk(value));
  }
  return Reply::array({Reply::bulk(entry.id.to_string()), Reply::array(std::move(fv))});
}

Reply unknown_command_reply(const std::vector<std::string>& args) {
  std::string msg = "unknown command '" + args[0] + "', with args beginning with:";
  for (std::size_t i = 1; i < args.size() && msg.size() < 128; ++i) msg += " '" + args[i] + "'";
  return error_reply(msg);
}

Reply push_command(const std::vector<std::string>& args, CommandContext& ctx, bool front) {
  const std::string& key = args[1];
  const std::vector<std::string> vals(args.begin() + 2, args.end());
  bool wrongtype = false;
  const auto n = front ? ctx.store.lpush(key, vals, wrongtype) : ctx.store.rpush(key, vals, wrongtype);
  if (wrongtype) return wrongtype_reply();
  // The reply carries the length right after the push, before waiters take their share.
  ctx.blocking.serve_key(key, ctx.store, monotonic_ms());
  return Reply::integer_value(n);
}

}  // namespace

bool CommandSpec::is_write() const {
  return std::find(flags.begin(), flags.end(), "write") != flags.end();
}

bool CommandSpec::accepts(std::size_t argc) const {
  if (argc < static_cast<std::size_t>(min_args)) return false;
  return max_args < 0 || argc <= static_cast<std::size_t>(max_args);
}

const std::unordered_map<std::string, CommandSpec>& command_table() {
  static const std::unordered_map<std::string, CommandSpec> table = [] {
    std::unordered_map<std::string, CommandSpec> t;

    t.emplace("PING", CommandSpec{"PING", 0, 0, {"fast"}, std::nullopt,
        [](const std::vector<std::string>&, CommandContext&) { return Reply::status("PONG"); }});

    t.emplace("ECHO", CommandSpec{"ECHO", 1, 1, {"fast"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext&) { return Reply::bulk(args[1]); }});

    t.emplace("QUIT", CommandSpec{"QUIT", 0, 0, {"fast"}, std::nullopt,
        [](const std::vector<std::string>&, CommandContext& ctx) {
          ctx.session.should_close = true;
          return ok_reply();
        }});

    t.emplace("TYPE", CommandSpec{"TYPE", 1, 1, {"readonly", "fast"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          return Reply::status(ctx.store.type_of(args[1]));
        }});

    t.emplace("EXISTS", CommandSpec{"EXISTS", 1, -1, {"readonly", "fast"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          const std::vector<std::string> keys(args.begin() + 1, args.end());
          return Reply::integer_value(static_cast<std::int64_t>(ctx.store.exists(keys)));
        }});

    t.emplace("DEL", CommandSpec{"DEL", 1, -1, {"write"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          std::int64_t n = 0;
          for (std::size_t i = 1; i < args.size(); ++i) n += ctx.store.del(args[i]) ? 1 : 0;
          return Reply::integer_value(n);
        }});

    t.emplace("SET", CommandSpec{"SET", 2, 2, {"write"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          ctx.store.set(args[1], args[2]);
          return ok_reply();
        }});

    t.emplace("GET", CommandSpec{"GET", 1, 1, {"readonly", "fast"}, ValueType::String,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          bool wrongtype = false;
          auto v = ctx.store.get(args[1], wrongtype);
          if (wrongtype) return wrongtype_reply();
          return v.has_value() ? Reply::bulk(std::move(*v)) : Reply::null_bulk();
        }});

    t.emplace("INCR", CommandSpec{"INCR", 1, 1, {"write", "fast"}, ValueType::String,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          bool wrongtype = false;
          std::string err;
          const auto n = ctx.store.incrby(args[1], 1, wrongtype, err);
          if (wrongtype) return wrongtype_reply();
          if (!n.has_value()) return error_reply(err);
          return Reply::integer_value(*n);
        }});

    t.emplace("RPUSH", CommandSpec{"RPUSH", 2, -1, {"write"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) { return push_command(args, ctx, false); }});

    t.emplace("LPUSH", CommandSpec{"LPUSH", 2, -1, {"write"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) { return push_command(args, ctx, true); }});

    t.emplace("LLEN", CommandSpec{"LLEN", 1, 1, {"readonly", "fast"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          bool wrongtype = false;
          const auto n = ctx.store.llen(args[1], wrongtype);
          if (wrongtype) return wrongtype_reply();
          return Reply::integer_value(n);
        }});

    t.emplace("LRANGE", CommandSpec{"LRANGE", 3, 3, {"readonly"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          const auto start = integer_arg(args[2]);
          const auto stop = integer_arg(args[3]);
          bool wrongtype = false;
          const auto vals = ctx.store.lrange(args[1], start, stop, wrongtype);
          if (wrongtype) return wrongtype_reply();
          return Reply::bulk_array(vals);
        }});

    t.emplace("LPOP", CommandSpec{"LPOP", 1, 2, {"write", "fast"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          bool wrongtype = false;
          if (args.size() == 2) {
            auto v = ctx.store.lpop(args[1], wrongtype);
            if (wrongtype) return wrongtype_reply();
            return v.has_value() ? Reply::bulk(std::move(*v)) : Reply::null_bulk();
          }
          const auto count = count_arg(args[2]);
          const auto vals = ctx.store.lpop(args[1], count, wrongtype);
          if (wrongtype) return wrongtype_reply();
          return Reply::bulk_array(vals);
        }});

    t.emplace("BLPOP", CommandSpec{"BLPOP", 2, 2, {"write", "blocking"}, ValueType::List,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          const std::string& key = args[1];
          const auto timeout_ms = timeout_arg(args[2]);

          bool wrongtype = false;
          auto v = ctx.store.lpop(key, wrongtype);
          if (wrongtype) return wrongtype_reply();
          if (v.has_value()) return Reply::array({Reply::bulk(key), Reply::bulk(std::move(*v))});

          auto& blocked = ctx.session.blocked;
          blocked.active = true;
          blocked.key = key;
          blocked.deadline_ms = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;
          ctx.blocking.block(key, ctx.session.client_id, blocked.deadline_ms);
          return Reply::none();
        }});

    t.emplace("XADD", CommandSpec{"XADD", 4, -1, {"write"}, ValueType::Stream,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          if (((args.size() - 3) % 2) != 0) return error_reply("wrong number of arguments for 'xadd' command");
          FieldList fields;
          fields.reserve((args.size() - 3) / 2);
          for (std::size_t i = 3; i < args.size(); i += 2) fields.emplace_back(args[i], args[i + 1]);
          bool wrongtype = false;
          std::string err;
          const auto id = ctx.store.xadd(args[1], args[2], fields, wrongtype, err);
          if (wrongtype) return wrongtype_reply();
          if (!id.has_value()) return error_reply(err);
          return Reply::bulk(id->to_string());
        }});

    t.emplace("XRANGE", CommandSpec{"XRANGE", 3, 5, {"readonly"}, ValueType::Stream,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          const StreamId start = range_start_arg(args[2]);
          const StreamId end = range_end_arg(args[3]);
          std::optional<std::size_t> count;
          if (args.size() != 4) {
            if (args.size() != 6 || upper(args[4]) != "COUNT") return error_reply("syntax error");
            const auto n = integer_arg(args[5]);
            count = n > 0 ? static_cast<std::size_t>(n) : 0;
          }
          bool wrongtype = false;
          const auto entries = ctx.store.xrange(args[1], start, end, count, wrongtype);
          if (wrongtype) return wrongtype_reply();
          std::vector<Reply> out;
          out.reserve(entries.size());
          for (const auto& entry : entries) out.push_back(stream_entry_reply(entry));
          return Reply::array(std::move(out));
        }});

    t.emplace("XLEN", CommandSpec{"XLEN", 1, 1, {"readonly", "fast"}, ValueType::Stream,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          bool wrongtype = false;
          const auto n = ctx.store.xlen(args[1], wrongtype);
          if (wrongtype) return wrongtype_reply();
          return Reply::integer_value(n);
        }});

    t.emplace("FLUSHDB", CommandSpec{"FLUSHDB", 0, 1, {"write"}, std::nullopt,
        [](const std::vector<std::string>& args, CommandContext& ctx) {
          if (args.size() == 2) {
            const auto mode = upper(args[1]);
            if (mode != "SYNC" && mode != "ASYNC") return error_reply("syntax error");
          }
          ctx.store.flushdb();
          return ok_reply();
        }});

    t.emplace("SHUTDOWN", CommandSpec{"SHUTDOWN", 0, -1, {"admin"}, std::nullopt,
        [](const std::vector<std::string>&, CommandContext& ctx) {
          log(LogLevel::Info, "SHUTDOWN requested by client " + std::to_string(ctx.session.client_id));
          request_shutdown();
          ctx.session.should_close = true;
          return Reply::none();
        }});

    return t;
  }();
  return table;
}

const CommandSpec* find_command(const std::string& name) {
  const auto& table = command_table();
  const auto it = table.find(upper(name));
  return it == table.end() ? nullptr : &it->second;
}

Reply handle_command(const std::vector<std::string>& args, CommandContext& ctx) {
  if (args.empty()) return error_reply("empty command");

  auto& session = ctx.session;
  session.current_command = upper(args[0]);
  ++session.commands_processed;
  const std::string& cmd = session.current_command;

  const CommandSpec* spec = find_command(cmd);
  if (spec == nullptr) return unknown_command_reply(args);

  const std::size_t argc = args.size() - 1;
  if (!spec->accepts(argc)) {
    return error_reply("wrong number of arguments for '" + lower(cmd) + "' command");
  }
  if (spec->key_type.has_value() && ctx.store.is_wrongtype(args[1], *spec->key_type)) {
    return wrongtype_reply();
  }

  if (log_enabled(LogLevel::Debug)) {
    log(LogLevel::Debug, "client " + std::to_string(session.client_id) + ": " + cmd + " (" +
                             std::to_string(argc) + " args)");
  }

  Reply reply;
  try {
    reply = spec->handler(args, ctx);
  } catch (const CommandError& e) {
    reply = Reply::error(e.kind(), e.what());
  }

  if (log_enabled(LogLevel::Debug)) {
    if (reply.is_error()) {
      log(LogLevel::Debug, "client " + std::to_string(session.client_id) + ": " + cmd + " failed: " + reply.text);
    } else if (spec->is_write()) {
      log(LogLevel::Debug, "store after " + cmd + ": keys=" + std::to_string(ctx.store.dbsize()) +
                               " epoch=" + std::to_string(ctx.store.mutation_epoch()) +
                               " blocked=" + std::to_string(ctx.blocking.blocked_clients()));
    }
  }
  return reply;
}

} // namespace emberkv
