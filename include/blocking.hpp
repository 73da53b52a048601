#pragma once

#include "datastore.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace emberkv {

// Monotonic milliseconds for waiter deadlines.
std::int64_t monotonic_ms();

// A reply owed to a client that was suspended in BLPOP.
struct Wakeup {
  std::uint64_t client_id = 0;
  std::string key;
  Reply reply;
  bool timed_out = false;
};

// Per-key FIFO queues of clients suspended in BLPOP.
//
// A waiter leaves its queue exactly once: served with data, expired, or
// cancelled. A waiter whose deadline is at or before the time a push is
// served is expired rather than served, so when both fall on the same
// instant the timeout wins.
class BlockingCoordinator {
 public:
  // deadline_ms == 0 waits forever. A client waits on at most one key.
  void block(const std::string& key, std::uint64_t client_id, std::int64_t deadline_ms);

  // Drops the client's waiter without producing a reply. Returns false if it had none.
  bool cancel(std::uint64_t client_id);

  // Hands the front elements of the list at `key` to its waiters, one element
  // per waiter in blocking order, until either runs out.
  void serve_key(const std::string& key, DataStore& store, std::int64_t now_ms);

  // Expires every waiter whose deadline is <= now_ms with a null-array reply.
  void expire(std::int64_t now_ms);

  std::optional<std::int64_t> next_deadline() const;

  // Replies produced since the last call, in the order they were resolved.
  std::vector<Wakeup> take_ready();
  bool has_ready() const { return !ready_.empty(); }

  bool is_blocked(std::uint64_t client_id) const;
  std::size_t waiters_on(const std::string& key) const;
  std::size_t blocked_clients() const { return key_by_client_.size(); }

 private:
  struct Waiter {
    std::uint64_t client_id = 0;
    std::int64_t deadline_ms = 0;
  };

  void remove_waiter(const std::string& key, std::uint64_t client_id);
  void forget_deadline(std::int64_t deadline_ms, std::uint64_t client_id);

  std::unordered_map<std::string, std::deque<Waiter>> queues_;
  std::unordered_map<std::uint64_t, std::string> key_by_client_;
  std::multimap<std::int64_t, std::uint64_t> deadlines_;
  std::vector<Wakeup> ready_;
};

} // namespace emberkv
