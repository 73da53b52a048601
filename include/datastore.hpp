#pragma once

#include "stream_id.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace emberkv {

enum class ValueType {
  String,
  List,
  Stream,
};

const char* value_type_name(ValueType type);

using FieldList = std::vector<std::pair<std::string, std::string>>;

struct StreamEntry {
  StreamId id;
  FieldList fields;
};

struct StreamValue {
  std::vector<StreamEntry> entries;
  StreamIdAllocator ids;
};

struct Entry {
  ValueType type = ValueType::String;
  std::string value;
  std::deque<std::string> list_value;
  StreamValue stream_value;
};

// The keyspace. Every method is one atomic operation; a call that reports
// `wrongtype` or `err` leaves the stored value untouched.
class DataStore {
 public:
  DataStore() = default;

  std::optional<std::string> get(const std::string& key, bool& wrongtype) const;
  void set(const std::string& key, const std::string& value);
  std::optional<std::int64_t> incrby(const std::string& key, std::int64_t by, bool& wrongtype, std::string& err);

  bool del(const std::string& key);
  std::size_t exists(const std::vector<std::string>& keys) const;
  std::string type_of(const std::string& key) const;
  std::optional<ValueType> type_at(const std::string& key) const;
  bool is_wrongtype(const std::string& key, ValueType wanted) const;

  std::int64_t lpush(const std::string& key, const std::vector<std::string>& values, bool& wrongtype);
  std::int64_t rpush(const std::string& key, const std::vector<std::string>& values, bool& wrongtype);
  std::optional<std::string> lpop(const std::string& key, bool& wrongtype);
  std::vector<std::string> lpop(const std::string& key, std::size_t count, bool& wrongtype);
  std::int64_t llen(const std::string& key, bool& wrongtype) const;
  std::vector<std::string> lrange(const std::string& key, std::int64_t start, std::int64_t stop,
                                  bool& wrongtype) const;

  std::optional<StreamId> xadd(const std::string& key, const std::string& id, const FieldList& fields,
                               bool& wrongtype, std::string& err);
  std::int64_t xlen(const std::string& key, bool& wrongtype) const;
  std::vector<StreamEntry> xrange(const std::string& key, const StreamId& start, const StreamId& end,
                                  std::optional<std::size_t> count, bool& wrongtype) const;

  void flushdb();
  std::size_t dbsize() const;
  // Bumped by every successful mutation.
  std::uint64_t mutation_epoch() const { return mutation_epoch_; }

  // Wall-clock milliseconds, used for stream IDs. Tests may pin it.
  static std::int64_t now_ms();
  static void freeze_time(std::int64_t at_ms);
  static void unfreeze_time();

 private:
  using DB = std::unordered_map<std::string, Entry>;

  Entry* find_typed(const std::string& key, ValueType type, bool& wrongtype);
  const Entry* find_typed(const std::string& key, ValueType type, bool& wrongtype) const;
  Entry* find_or_create(const std::string& key, ValueType type, bool& wrongtype);

  DB db_;
  std::uint64_t mutation_epoch_ = 0;
  static inline std::int64_t frozen_time_ms_ = 0;
  static inline bool time_frozen_ = false;
};

} // namespace emberkv
