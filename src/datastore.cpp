#include "datastore.hpp"

#include <algorithm>
#include <chrono>
#include <charconv>
#include <limits>

namespace emberkv {

const char* value_type_name(ValueType type) {
  switch (type) {
    case ValueType::String:
      return "string";
    case ValueType::List:
      return "list";
    case ValueType::Stream:
      return "stream";
  }
  return "none";
}

std::int64_t DataStore::now_ms() {
  if (time_frozen_) return frozen_time_ms_;
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void DataStore::freeze_time(std::int64_t at_ms) {
  frozen_time_ms_ = at_ms;
  time_frozen_ = true;
}

void DataStore::unfreeze_time() {
  time_frozen_ = false;
}

Entry* DataStore::find_typed(const std::string& key, ValueType type, bool& wrongtype) {
  wrongtype = false;
  auto it = db_.find(key);
  if (it == db_.end()) return nullptr;
  if (it->second.type != type) {
    wrongtype = true;
    return nullptr;
  }
  return &it->second;
}

const Entry* DataStore::find_typed(const std::string& key, ValueType type, bool& wrongtype) const {
  wrongtype = false;
  auto it = db_.find(key);
  if (it == db_.end()) return nullptr;
  if (it->second.type != type) {
    wrongtype = true;
    return nullptr;
  }
  return &it->second;
}

Entry* DataStore::find_or_create(const std::string& key, ValueType type, bool& wrongtype) {
  Entry* e = find_typed(key, type, wrongtype);
  if (e != nullptr || wrongtype) return e;
  Entry fresh;
  fresh.type = type;
  return &db_.emplace(key, std::move(fresh)).first->second;
}

std::optional<std::string> DataStore::get(const std::string& key, bool& wrongtype) const {
  const Entry* e = find_typed(key, ValueType::String, wrongtype);
  if (e == nullptr) return std::nullopt;
  return e->value;
}

void DataStore::set(const std::string& key, const std::string& value) {
  // Any previous value is replaced whatever its type.
  Entry e;
  e.type = ValueType::String;
  e.value = value;
  db_[key] = std::move(e);
  ++mutation_epoch_;
}

std::optional<std::int64_t> DataStore::incrby(const std::string& key, std::int64_t by, bool& wrongtype,
                                              std::string& err) {
  err.clear();
  Entry* e = find_typed(key, ValueType::String, wrongtype);
  if (wrongtype) return std::nullopt;

  std::int64_t current = 0;
  if (e != nullptr) {
    const auto& s = e->value;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), current);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size()) {
      err = "value is not an integer or out of range";
      return std::nullopt;
    }
  }
  if ((by > 0 && current > std::numeric_limits<std::int64_t>::max() - by) ||
      (by < 0 && current < std::numeric_limits<std::int64_t>::min() - by)) {
    err = "increment or decrement would overflow";
    return std::nullopt;
  }
  const std::int64_t next = current + by;
  if (e == nullptr) {
    e = find_or_create(key, ValueType::String, wrongtype);
  }
  e->value = std::to_string(next);
  ++mutation_epoch_;
  return next;
}

bool DataStore::del(const std::string& key) {
  if (db_.erase(key) == 0) return false;
  ++mutation_epoch_;
  return true;
}

std::size_t DataStore::exists(const std::vector<std::string>& keys) const {
  std::size_t n = 0;
  for (const auto& key : keys) {
    if (db_.find(key) != db_.end()) ++n;
  }
  return n;
}

std::optional<ValueType> DataStore::type_at(const std::string& key) const {
  const auto it = db_.find(key);
  if (it == db_.end()) return std::nullopt;
  return it->second.type;
}

std::string DataStore::type_of(const std::string& key) const {
  const auto type = type_at(key);
  return type.has_value() ? value_type_name(*type) : "none";
}

bool DataStore::is_wrongtype(const std::string& key, ValueType wanted) const {
  const auto type = type_at(key);
  return type.has_value() && *type != wanted;
}

std::int64_t DataStore::lpush(const std::string& key, const std::vector<std::string>& values, bool& wrongtype) {
  Entry* e = find_or_create(key, ValueType::List, wrongtype);
  if (wrongtype) return 0;
  for (const auto& v : values) e->list_value.push_front(v);
  ++mutation_epoch_;
  return static_cast<std::int64_t>(e->list_value.size());
}

std::int64_t DataStore::rpush(const std::string& key, const std::vector<std::string>& values, bool& wrongtype) {
  Entry* e = find_or_create(key, ValueType::List, wrongtype);
  if (wrongtype) return 0;
  for (const auto& v : values) e->list_value.push_back(v);
  ++mutation_epoch_;
  return static_cast<std::int64_t>(e->list_value.size());
}

std::optional<std::string> DataStore::lpop(const std::string& key, bool& wrongtype) {
  auto popped = lpop(key, 1, wrongtype);
  if (popped.empty()) return std::nullopt;
  return std::move(popped.front());
}

std::vector<std::string> DataStore::lpop(const std::string& key, std::size_t count, bool& wrongtype) {
  std::vector<std::string> out;
  Entry* e = find_typed(key, ValueType::List, wrongtype);
  if (e == nullptr || count == 0) return out;

  auto& list = e->list_value;
  const std::size_t n = std::min(count, list.size());
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(std::move(list.front()));
    list.pop_front();
  }
  // Empty lists do not linger as keys.
  if (list.empty()) db_.erase(key);
  if (!out.empty()) ++mutation_epoch_;
  return out;
}

std::int64_t DataStore::llen(const std::string& key, bool& wrongtype) const {
  const Entry* e = find_typed(key, ValueType::List, wrongtype);
  if (e == nullptr) return 0;
  return static_cast<std::int64_t>(e->list_value.size());
}

std::vector<std::string> DataStore::lrange(const std::string& key, std::int64_t start, std::int64_t stop,
                                           bool& wrongtype) const {
  std::vector<std::string> out;
  const Entry* e = find_typed(key, ValueType::List, wrongtype);
  if (e == nullptr) return out;

  const auto n = static_cast<std::int64_t>(e->list_value.size());
  if (n == 0) return out;

  if (start < 0) start = n + start;
  if (stop < 0) stop = n + stop;
  if (start < 0) start = 0;
  if (stop >= n) stop = n - 1;
  if (start > stop || start >= n) return out;

  out.reserve(static_cast<std::size_t>(stop - start + 1));
  for (std::int64_t i = start; i <= stop; ++i) out.push_back(e->list_value[static_cast<std::size_t>(i)]);
  return out;
}

std::optional<StreamId> DataStore::xadd(const std::string& key, const std::string& id, const FieldList& fields,
                                        bool& wrongtype, std::string& err) {
  err.clear();
  Entry* e = find_typed(key, ValueType::Stream, wrongtype);
  if (wrongtype) return std::nullopt;

  // Validate before creating the key so a rejected ID leaves no empty stream.
  const StreamIdAllocator empty_stream;
  const StreamIdAllocator& ids = e != nullptr ? e->stream_value.ids : empty_stream;
  const auto assigned = ids.resolve(id, static_cast<std::uint64_t>(now_ms()), err);
  if (!assigned.has_value()) return std::nullopt;

  if (e == nullptr) e = find_or_create(key, ValueType::Stream, wrongtype);
  e->stream_value.ids.commit(*assigned);
  e->stream_value.entries.push_back(StreamEntry{*assigned, fields});
  ++mutation_epoch_;
  return assigned;
}

std::int64_t DataStore::xlen(const std::string& key, bool& wrongtype) const {
  const Entry* e = find_typed(key, ValueType::Stream, wrongtype);
  if (e == nullptr) return 0;
  return static_cast<std::int64_t>(e->stream_value.entries.size());
}

std::vector<StreamEntry> DataStore::xrange(const std::string& key, const StreamId& start, const StreamId& end,
                                           std::optional<std::size_t> count, bool& wrongtype) const {
  std::vector<StreamEntry> out;
  const Entry* e = find_typed(key, ValueType::Stream, wrongtype);
  if (e == nullptr || end < start) return out;
  if (count.has_value() && *count == 0) return out;

  const auto& entries = e->stream_value.entries;
  auto it = std::lower_bound(entries.begin(), entries.end(), start,
                             [](const StreamEntry& entry, const StreamId& id) { return entry.id < id; });
  for (; it != entries.end() && it->id <= end; ++it) {
    out.push_back(*it);
    if (count.has_value() && out.size() >= *count) break;
  }
  return out;
}

void DataStore::flushdb() {
  db_.clear();
  ++mutation_epoch_;
}

std::size_t DataStore::dbsize() const { return db_.size(); }

} // namespace emberkv
