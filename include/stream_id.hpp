#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace emberkv {

struct StreamId {
  std::uint64_t ms = 0;
  std::uint64_t seq = 0;

  static constexpr StreamId min() { return StreamId{0, 0}; }
  static constexpr StreamId max() {
    return StreamId{std::numeric_limits<std::uint64_t>::max(), std::numeric_limits<std::uint64_t>::max()};
  }

  std::string to_string() const;
};

inline bool operator==(const StreamId& a, const StreamId& b) { return a.ms == b.ms && a.seq == b.seq; }
inline bool operator!=(const StreamId& a, const StreamId& b) { return !(a == b); }
inline bool operator<(const StreamId& a, const StreamId& b) {
  return a.ms != b.ms ? a.ms < b.ms : a.seq < b.seq;
}
inline bool operator<=(const StreamId& a, const StreamId& b) { return !(b < a); }
inline bool operator>(const StreamId& a, const StreamId& b) { return b < a; }

// Parses "ms-seq". A bare "ms" is accepted and takes `default_seq`.
bool parse_stream_id(const std::string& text, std::uint64_t default_seq, StreamId& out);

// XRANGE bounds: "-" and "+" sentinels, "ms" or "ms-seq".
bool parse_range_start(const std::string& text, StreamId& out);
bool parse_range_end(const std::string& text, StreamId& out);

// Hands out entry IDs for one stream and remembers the last one accepted.
class StreamIdAllocator {
 public:
  // Resolves an XADD id argument ("*", "ms-*" or "ms-seq") against the last
  // ID. Returns nullopt and sets `err` when the id is malformed or would not
  // be strictly greater than the last ID. Does not change state.
  std::optional<StreamId> resolve(const std::string& id_arg, std::uint64_t now_ms, std::string& err) const;

  // Records an ID returned by resolve().
  void commit(const StreamId& id) { last_ = id; }

  const StreamId& last() const { return last_; }

 private:
  StreamId last_;
};

} // namespace emberkv
