#include "command.hpp"
#include "logger.hpp"
#include "server.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

int g_failures = 0;

void check(bool ok, const std::string& what) {
  if (!ok) {
    std::cerr << "FAILED: " << what << "\n";
    ++g_failures;
  }
}

struct Harness {
  emberkv::DataStore store;
  emberkv::BlockingCoordinator blocking;
  emberkv::SessionState a;
  emberkv::SessionState b;
  emberkv::CommandContext ctx_a{store, blocking, a};
  emberkv::CommandContext ctx_b{store, blocking, b};

  Harness() {
    a.client_id = 1;
    b.client_id = 2;
  }

  std::string run(const std::vector<std::string>& args) { return run_as(ctx_a, args); }

  static std::string run_as(emberkv::CommandContext& ctx, const std::vector<std::string>& args) {
    return emberkv::encode_reply(emberkv::handle_command(args, ctx));
  }
};

}  // namespace

int main() {
  emberkv::set_log_level(emberkv::LogLevel::Error);

  {
    Harness h;
    check(h.run({"PING"}) == "+PONG\r\n", "PING");
    check(h.run({"ping"}) == "+PONG\r\n", "command names are case-insensitive");
    check(h.run({"PING", "x"}) == "-ERR wrong number of arguments for 'ping' command\r\n", "PING arity");
    check(h.run({"ECHO", "hey"}) == "$3\r\nhey\r\n", "ECHO");
    check(h.run({"ECHO", ""}) == "$0\r\n\r\n", "ECHO empty");
    check(h.run({"ECHO"}) == "-ERR wrong number of arguments for 'echo' command\r\n", "ECHO arity");
    check(h.run({"NOPE", "a"}) == "-ERR unknown command 'NOPE', with args beginning with: 'a'\r\n",
          "unknown command");
  }

  {
    Harness h;
    check(h.run({"GET", "k"}) == "$-1\r\n", "GET missing");
    check(h.run({"SET", "k", "v"}) == "+OK\r\n", "SET");
    check(h.run({"GET", "k"}) == "$1\r\nv\r\n", "GET");
    check(h.run({"SET", "k"}) == "-ERR wrong number of arguments for 'set' command\r\n", "SET arity");
    check(h.run({"INCR", "n"}) == ":1\r\n" && h.run({"INCR", "n"}) == ":2\r\n", "INCR");
    check(h.run({"INCR", "k"}) == "-ERR value is not an integer or out of range\r\n", "INCR non-integer");
    check(h.run({"TYPE", "k"}) == "+string\r\n" && h.run({"TYPE", "none"}) == "+none\r\n", "TYPE");
    check(h.run({"EXISTS", "k", "n", "zz"}) == ":2\r\n", "EXISTS");
    check(h.run({"DEL", "k", "zz"}) == ":1\r\n", "DEL");
    check(h.run({"FLUSHDB"}) == "+OK\r\n" && h.run({"EXISTS", "n"}) == ":0\r\n", "FLUSHDB");
    check(h.run({"FLUSHDB", "ASYNC"}) == "+OK\r\n", "FLUSHDB ASYNC");
    check(h.run({"FLUSHDB", "LATER"}) == "-ERR syntax error\r\n", "FLUSHDB bad mode");
  }

  {
    Harness h;
    check(h.run({"RPUSH", "l", "a", "b"}) == ":2\r\n", "RPUSH");
    check(h.run({"LPUSH", "l", "c"}) == ":3\r\n", "LPUSH");
    check(h.run({"LRANGE", "l", "0", "-1"}) == "*3\r\n$1\r\nc\r\n$1\r\na\r\n$1\r\nb\r\n", "LRANGE");
    check(h.run({"LRANGE", "l", "x", "1"}) == "-ERR value is not an integer or out of range\r\n", "LRANGE bad index");
    check(h.run({"LLEN", "l"}) == ":3\r\n", "LLEN");
    check(h.run({"LPOP", "l"}) == "$1\r\nc\r\n", "LPOP");
    check(h.run({"LPOP", "l", "5"}) == "*2\r\n$1\r\na\r\n$1\r\nb\r\n", "LPOP count");
    check(h.run({"LPOP", "l"}) == "$-1\r\n", "LPOP drained");
    check(h.run({"LPOP", "l", "2"}) == "*0\r\n", "LPOP count on missing key");
    check(h.run({"LPOP", "l", "-1"}) == "-ERR value is out of range, must be positive\r\n", "LPOP negative");
    check(h.run({"RPUSH", "l"}) == "-ERR wrong number of arguments for 'rpush' command\r\n", "RPUSH arity");
  }

  {
    Harness h;
    check(h.run({"XADD", "s", "1-1", "f", "v"}) == "$3\r\n1-1\r\n", "XADD explicit");
    check(h.run({"XADD", "s", "1-*", "g", "w"}) == "$3\r\n1-2\r\n", "XADD ms-*");
    check(h.run({"XADD", "s", "1-1", "f", "v"}) ==
              "-ERR The ID specified in XADD is equal or smaller than the target stream top item\r\n",
          "XADD stale ID");
    check(h.run({"XADD", "s", "0-0", "f", "v"}) == "-ERR The ID specified in XADD must be greater than 0-0\r\n",
          "XADD 0-0");
    check(h.run({"XADD", "s", "bad", "f", "v"}) ==
              "-ERR Invalid stream ID specified as stream command argument\r\n",
          "XADD malformed ID");
    check(h.run({"XADD", "s", "9-9", "f"}) == "-ERR wrong number of arguments for 'xadd' command\r\n",
          "XADD odd field list");
    check(h.run({"XLEN", "s"}) == ":2\r\n", "XLEN");
    check(h.run({"XRANGE", "s", "-", "+"}) ==
              "*2\r\n*2\r\n$3\r\n1-1\r\n*2\r\n$1\r\nf\r\n$1\r\nv\r\n*2\r\n$3\r\n1-2\r\n*2\r\n$1\r\ng\r\n$1\r\nw\r\n",
          "XRANGE all");
    check(h.run({"XRANGE", "s", "1-2", "+", "COUNT", "1"}) ==
              "*1\r\n*2\r\n$3\r\n1-2\r\n*2\r\n$1\r\ng\r\n$1\r\nw\r\n",
          "XRANGE COUNT");
    check(h.run({"XRANGE", "s", "-", "+", "LIMIT", "1"}) == "-ERR syntax error\r\n", "XRANGE bad option");
    check(h.run({"XRANGE", "nostream", "-", "+"}) == "*0\r\n", "XRANGE missing key");
    check(h.run({"TYPE", "s"}) == "+stream\r\n", "TYPE stream");
  }

  {
    // BLPOP served immediately when data exists.
    Harness h;
    h.run({"RPUSH", "q", "x"});
    check(h.run({"BLPOP", "q", "0"}) == "*2\r\n$1\r\nq\r\n$1\r\nx\r\n", "BLPOP immediate");
    check(h.run({"BLPOP", "q", "abc"}) == "-ERR timeout is not a float or out of range\r\n", "BLPOP bad timeout");
    check(h.run({"BLPOP", "q", "-1"}) == "-ERR timeout is negative\r\n", "BLPOP negative timeout");
    check(h.run({"BLPOP", "q", "1e20"}) == "-ERR timeout is not a float or out of range\r\n", "BLPOP huge timeout");
  }

  {
    // Two blocked sessions, one push of two elements.
    Harness h;
    emberkv::SessionState c;
    c.client_id = 3;
    emberkv::CommandContext ctx_c{h.store, h.blocking, c};

    check(Harness::run_as(h.ctx_a, {"BLPOP", "q", "0"}).empty() && h.a.blocked.active, "first client blocks");
    check(Harness::run_as(h.ctx_b, {"BLPOP", "q", "0.5"}).empty() && h.b.blocked.deadline_ms > 0,
          "second client blocks with a deadline");
    check(h.blocking.waiters_on("q") == 2, "two waiters");

    check(Harness::run_as(ctx_c, {"RPUSH", "q", "one", "two"}) == ":2\r\n", "push reply is the post-push length");
    const auto woken = h.blocking.take_ready();
    check(woken.size() == 2, "both waiters woken");
    check(woken.size() == 2 && woken[0].client_id == 1 &&
              emberkv::encode_reply(woken[0].reply) == "*2\r\n$1\r\nq\r\n$3\r\none\r\n",
          "oldest waiter gets the first element");
    check(woken.size() == 2 && woken[1].client_id == 2 &&
              emberkv::encode_reply(woken[1].reply) == "*2\r\n$1\r\nq\r\n$3\r\ntwo\r\n",
          "next waiter gets the second element");
    check(Harness::run_as(ctx_c, {"LLEN", "q"}) == ":0\r\n", "nothing left over");
  }

  {
    Harness h;
    emberkv::reset_shutdown_request();
    check(h.run({"QUIT"}) == "+OK\r\n" && h.a.should_close, "QUIT closes after replying");
    check(h.run({"SHUTDOWN"}).empty() && emberkv::shutdown_requested(), "SHUTDOWN requests a stop");
    emberkv::reset_shutdown_request();
    check(!emberkv::shutdown_requested(), "shutdown request resets");
  }

  if (g_failures != 0) return 1;
  std::cout << "command_dispatch_test passed\n";
  return 0;
}
