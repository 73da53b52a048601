#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace emberkv {

constexpr std::size_t kMaxArrayLength = 1024 * 1024;
constexpr std::int64_t kMaxBulkLength = 512LL * 1024 * 1024;
constexpr std::size_t kMaxLineLength = 64 * 1024;

// A typed RESP2 reply. Arrays nest.
struct Reply {
  enum class Kind {
    None,  // nothing is written back (blocked client, SHUTDOWN)
    Status,
    Error,
    Integer,
    Bulk,
    NullBulk,
    Array,
    NullArray,
  };

  Kind kind = Kind::None;
  std::string text;
  std::int64_t integer = 0;
  std::vector<Reply> elements;

  static Reply none() { return Reply{}; }
  static Reply status(std::string s);
  static Reply error(const std::string& kind, const std::string& message);
  static Reply integer_value(std::int64_t n);
  static Reply bulk(std::string s);
  static Reply null_bulk();
  static Reply array(std::vector<Reply> items);
  static Reply null_array();
  static Reply bulk_array(const std::vector<std::string>& items);

  bool is_error() const { return kind == Kind::Error; }
  bool is_none() const { return kind == Kind::None; }
  // "WRONGTYPE", "ERR", ... for error replies, empty otherwise.
  std::string error_kind() const;
};

void encode_reply(const Reply& reply, std::string& out);
std::string encode_reply(const Reply& reply);

// Incremental request decoder. Bytes may arrive split at any position; state
// survives between feed() calls. Throws ProtocolError on malformed framing.
class RequestDecoder {
 public:
  void feed(std::string_view bytes);

  // Returns the next complete request, or nullopt when more bytes are needed.
  std::optional<std::vector<std::string>> next();

  // True when some bytes of an unfinished request are buffered.
  bool has_partial() const;

  // Called when the peer closed the stream. Throws if a request is unfinished.
  void finish() const;

  std::size_t buffered() const { return buffer_.size() - pos_; }
  // Argument slots allocated for the request being decoded.
  std::size_t argument_capacity() const { return args_.capacity(); }

 private:
  enum class State {
    AwaitingType,
    ReadingArrayLength,
    ReadingElementLength,
    ReadingElementPayload,
    FrameComplete,
  };

  std::optional<std::string_view> read_line();
  bool read_inline();
  void compact();

  std::string buffer_;
  std::size_t pos_ = 0;
  State state_ = State::AwaitingType;
  std::size_t remaining_elements_ = 0;
  std::size_t payload_length_ = 0;
  std::vector<std::string> args_;
};

} // namespace emberkv
