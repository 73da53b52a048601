#include "stream_id.hpp"

#include <charconv>

namespace emberkv {
namespace {

constexpr const char* kInvalidId = "Invalid stream ID specified as stream command argument";
constexpr const char* kZeroId = "The ID specified in XADD must be greater than 0-0";
constexpr const char* kNotGreater = "The ID specified in XADD is equal or smaller than the target stream top item";

bool parse_u64(const std::string& text, std::size_t begin, std::size_t end, std::uint64_t& out) {
  if (begin >= end) return false;
  const char* first = text.data() + begin;
  const char* last = text.data() + end;
  const auto res = std::from_chars(first, last, out);
  return res.ec == std::errc() && res.ptr == last;
}

}  // namespace

std::string StreamId::to_string() const {
  return std::to_string(ms) + "-" + std::to_string(seq);
}

bool parse_stream_id(const std::string& text, std::uint64_t default_seq, StreamId& out) {
  const auto dash = text.find('-');
  StreamId id;
  if (dash == std::string::npos) {
    if (!parse_u64(text, 0, text.size(), id.ms)) return false;
    id.seq = default_seq;
  } else {
    if (!parse_u64(text, 0, dash, id.ms)) return false;
    if (!parse_u64(text, dash + 1, text.size(), id.seq)) return false;
  }
  out = id;
  return true;
}

bool parse_range_start(const std::string& text, StreamId& out) {
  if (text == "-") {
    out = StreamId::min();
    return true;
  }
  return parse_stream_id(text, 0, out);
}

bool parse_range_end(const std::string& text, StreamId& out) {
  if (text == "+") {
    out = StreamId::max();
    return true;
  }
  return parse_stream_id(text, StreamId::max().seq, out);
}

std::optional<StreamId> StreamIdAllocator::resolve(const std::string& id_arg, std::uint64_t now_ms,
                                                   std::string& err) const {
  err.clear();
  constexpr auto kMaxSeq = StreamId::max().seq;

  if (id_arg == "*") {
    // A clock that went backwards keeps the last ms and bumps the sequence.
    if (now_ms > last_.ms) return StreamId{now_ms, 0};
    if (last_.seq == kMaxSeq) {
      if (last_.ms == StreamId::max().ms) {
        err = kNotGreater;
        return std::nullopt;
      }
      return StreamId{last_.ms + 1, 0};
    }
    return StreamId{last_.ms, last_.seq + 1};
  }

  const auto dash = id_arg.find('-');
  if (dash != std::string::npos && id_arg.compare(dash + 1, std::string::npos, "*") == 0) {
    std::uint64_t ms = 0;
    if (!parse_u64(id_arg, 0, dash, ms)) {
      err = kInvalidId;
      return std::nullopt;
    }
    if (ms < last_.ms || (ms == last_.ms && last_.seq == kMaxSeq)) {
      err = kNotGreater;
      return std::nullopt;
    }
    if (ms == last_.ms) return StreamId{ms, last_.seq + 1};
    return StreamId{ms, ms == 0 ? 1u : 0u};
  }

  StreamId id;
  if (!parse_stream_id(id_arg, 0, id)) {
    err = kInvalidId;
    return std::nullopt;
  }
  if (id == StreamId::min()) {
    err = kZeroId;
    return std::nullopt;
  }
  if (id <= last_) {
    err = kNotGreater;
    return std::nullopt;
  }
  return id;
}

} // namespace emberkv
