#include "blocking.hpp"

#include "logger.hpp"

#include <algorithm>
#include <chrono>

namespace emberkv {

std::int64_t monotonic_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

void BlockingCoordinator::block(const std::string& key, std::uint64_t client_id, std::int64_t deadline_ms) {
  cancel(client_id);
  queues_[key].push_back(Waiter{client_id, deadline_ms});
  key_by_client_[client_id] = key;
  if (deadline_ms > 0) deadlines_.emplace(deadline_ms, client_id);
  if (log_enabled(LogLevel::Debug)) {
    log(LogLevel::Debug, "client " + std::to_string(client_id) + " blocked on '" + key + "' (" +
                             std::to_string(queues_[key].size()) + " waiting)");
  }
}

bool BlockingCoordinator::cancel(std::uint64_t client_id) {
  const auto it = key_by_client_.find(client_id);
  if (it == key_by_client_.end()) return false;
  const std::string key = it->second;
  remove_waiter(key, client_id);
  log(LogLevel::Debug, "client " + std::to_string(client_id) + " stopped waiting on '" + key + "'");
  return true;
}

void BlockingCoordinator::remove_waiter(const std::string& key, std::uint64_t client_id) {
  key_by_client_.erase(client_id);
  auto qit = queues_.find(key);
  if (qit == queues_.end()) return;
  auto& queue = qit->second;
  const auto wit = std::find_if(queue.begin(), queue.end(),
                                [client_id](const Waiter& w) { return w.client_id == client_id; });
  if (wit != queue.end()) {
    if (wit->deadline_ms > 0) forget_deadline(wit->deadline_ms, client_id);
    queue.erase(wit);
  }
  if (queue.empty()) queues_.erase(qit);
}

void BlockingCoordinator::forget_deadline(std::int64_t deadline_ms, std::uint64_t client_id) {
  auto range = deadlines_.equal_range(deadline_ms);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == client_id) {
      deadlines_.erase(it);
      return;
    }
  }
}

void BlockingCoordinator::serve_key(const std::string& key, DataStore& store, std::int64_t now_ms) {
  if (queues_.find(key) == queues_.end()) return;
  expire(now_ms);

  while (true) {
    auto qit = queues_.find(key);
    if (qit == queues_.end()) return;

    bool wrongtype = false;
    auto value = store.lpop(key, wrongtype);
    if (!value.has_value()) return;

    const Waiter waiter = qit->second.front();
    remove_waiter(key, waiter.client_id);

    Wakeup w;
    w.client_id = waiter.client_id;
    w.key = key;
    w.reply = Reply::array({Reply::bulk(key), Reply::bulk(std::move(*value))});
    ready_.push_back(std::move(w));
    log(LogLevel::Debug, "served client " + std::to_string(waiter.client_id) + " from '" + key + "'");
  }
}

void BlockingCoordinator::expire(std::int64_t now_ms) {
  while (!deadlines_.empty() && deadlines_.begin()->first <= now_ms) {
    const std::uint64_t client_id = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());
    const auto kit = key_by_client_.find(client_id);
    if (kit == key_by_client_.end()) continue;
    const std::string key = kit->second;
    remove_waiter(key, client_id);

    Wakeup w;
    w.client_id = client_id;
    w.key = key;
    w.reply = Reply::null_array();
    w.timed_out = true;
    ready_.push_back(std::move(w));
    log(LogLevel::Debug, "client " + std::to_string(client_id) + " timed out waiting on '" + key + "'");
  }
}

std::optional<std::int64_t> BlockingCoordinator::next_deadline() const {
  if (deadlines_.empty()) return std::nullopt;
  return deadlines_.begin()->first;
}

std::vector<Wakeup> BlockingCoordinator::take_ready() {
  std::vector<Wakeup> out;
  out.swap(ready_);
  return out;
}

bool BlockingCoordinator::is_blocked(std::uint64_t client_id) const {
  return key_by_client_.find(client_id) != key_by_client_.end();
}

std::size_t BlockingCoordinator::waiters_on(const std::string& key) const {
  const auto it = queues_.find(key);
  return it == queues_.end() ? 0 : it->second.size();
}

} // namespace emberkv
