#include "protocol.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace emberkv {
namespace {

// The declared element count is untrusted until the elements arrive.
constexpr std::size_t kMaxReservedArguments = 1024;

bool parse_i64(std::string_view sv, std::int64_t& out) {
  if (sv.empty()) return false;
  bool negative = false;
  std::size_t i = 0;
  if (sv[0] == '-') {
    negative = true;
    i = 1;
    if (i == sv.size()) return false;
  }
  std::int64_t value = 0;
  for (; i < sv.size(); ++i) {
    const char c = sv[i];
    if (c < '0' || c > '9') return false;
    const int digit = c - '0';
    if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10) return false;
    value = value * 10 + digit;
  }
  out = negative ? -value : value;
  return true;
}

void append_header(char type, std::int64_t n, std::string& out) {
  out.push_back(type);
  out.append(std::to_string(n));
  out.append("\r\n");
}

}  // namespace

Reply Reply::status(std::string s) {
  Reply r;
  r.kind = Kind::Status;
  r.text = std::move(s);
  return r;
}

Reply Reply::error(const std::string& kind, const std::string& message) {
  Reply r;
  r.kind = Kind::Error;
  r.text = kind + " " + message;
  return r;
}

Reply Reply::integer_value(std::int64_t n) {
  Reply r;
  r.kind = Kind::Integer;
  r.integer = n;
  return r;
}

Reply Reply::bulk(std::string s) {
  Reply r;
  r.kind = Kind::Bulk;
  r.text = std::move(s);
  return r;
}

Reply Reply::null_bulk() {
  Reply r;
  r.kind = Kind::NullBulk;
  return r;
}

Reply Reply::array(std::vector<Reply> items) {
  Reply r;
  r.kind = Kind::Array;
  r.elements = std::move(items);
  return r;
}

Reply Reply::null_array() {
  Reply r;
  r.kind = Kind::NullArray;
  return r;
}

Reply Reply::bulk_array(const std::vector<std::string>& items) {
  std::vector<Reply> out;
  out.reserve(items.size());
  for (const auto& item : items) out.push_back(bulk(item));
  return array(std::move(out));
}

std::string Reply::error_kind() const {
  if (kind != Kind::Error) return "";
  const auto sp = text.find(' ');
  return sp == std::string::npos ? text : text.substr(0, sp);
}

void encode_reply(const Reply& reply, std::string& out) {
  switch (reply.kind) {
    case Reply::Kind::None:
      return;
    case Reply::Kind::Status:
      out.push_back('+');
      out.append(reply.text);
      out.append("\r\n");
      return;
    case Reply::Kind::Error:
      out.push_back('-');
      out.append(reply.text);
      out.append("\r\n");
      return;
    case Reply::Kind::Integer:
      append_header(':', reply.integer, out);
      return;
    case Reply::Kind::Bulk:
      append_header('$', static_cast<std::int64_t>(reply.text.size()), out);
      out.append(reply.text);
      out.append("\r\n");
      return;
    case Reply::Kind::NullBulk:
      out.append("$-1\r\n");
      return;
    case Reply::Kind::Array:
      append_header('*', static_cast<std::int64_t>(reply.elements.size()), out);
      for (const auto& item : reply.elements) encode_reply(item, out);
      return;
    case Reply::Kind::NullArray:
      out.append("*-1\r\n");
      return;
  }
}

std::string encode_reply(const Reply& reply) {
  std::string out;
  encode_reply(reply, out);
  return out;
}

void RequestDecoder::feed(std::string_view bytes) {
  compact();
  buffer_.append(bytes.data(), bytes.size());
}

bool RequestDecoder::has_partial() const {
  return state_ != State::AwaitingType || pos_ < buffer_.size();
}

void RequestDecoder::finish() const {
  if (has_partial()) {
    throw ProtocolError("connection closed in the middle of a request");
  }
}

void RequestDecoder::compact() {
  if (pos_ == 0) return;
  if (pos_ >= buffer_.size()) {
    buffer_.clear();
  } else {
    buffer_.erase(0, pos_);
  }
  pos_ = 0;
}

std::optional<std::string_view> RequestDecoder::read_line() {
  const auto line_end = buffer_.find("\r\n", pos_);
  if (line_end == std::string::npos) {
    if (buffer_.size() - pos_ > kMaxLineLength) {
      throw ProtocolError("too big request line");
    }
    return std::nullopt;
  }
  const std::string_view line(buffer_.data() + pos_, line_end - pos_);
  pos_ = line_end + 2;
  return line;
}

bool RequestDecoder::read_inline() {
  const auto line = read_line();
  if (!line.has_value()) return false;

  std::istringstream iss{std::string(*line)};
  std::string token;
  while (iss >> token) args_.push_back(token);
  return true;
}

std::optional<std::vector<std::string>> RequestDecoder::next() {
  while (true) {
    switch (state_) {
      case State::AwaitingType: {
        if (pos_ >= buffer_.size()) return std::nullopt;
        args_.clear();
        if (buffer_[pos_] != '*') {
          if (!read_inline()) return std::nullopt;
          // Blank lines between requests carry no command.
          if (args_.empty()) continue;
          state_ = State::FrameComplete;
          break;
        }
        ++pos_;
        state_ = State::ReadingArrayLength;
        break;
      }

      case State::ReadingArrayLength: {
        const auto line = read_line();
        if (!line.has_value()) return std::nullopt;
        std::int64_t count = 0;
        if (!parse_i64(*line, count) || count < -1) {
          throw ProtocolError("invalid multibulk length");
        }
        if (count > static_cast<std::int64_t>(kMaxArrayLength)) {
          throw ProtocolError("invalid multibulk length");
        }
        if (count <= 0) {
          // Null and empty arrays carry no command.
          state_ = State::AwaitingType;
          continue;
        }
        remaining_elements_ = static_cast<std::size_t>(count);
        args_.reserve(std::min(remaining_elements_, kMaxReservedArguments));
        state_ = State::ReadingElementLength;
        break;
      }

      case State::ReadingElementLength: {
        if (pos_ >= buffer_.size()) return std::nullopt;
        if (buffer_[pos_] != '$') {
          throw ProtocolError(std::string("expected '$', got '") + buffer_[pos_] + "'");
        }
        const std::size_t header_start = pos_;
        ++pos_;
        const auto line = read_line();
        if (!line.has_value()) {
          pos_ = header_start;
          return std::nullopt;
        }
        std::int64_t len = 0;
        if (!parse_i64(*line, len) || len < -1 || len > kMaxBulkLength) {
          throw ProtocolError("invalid bulk length");
        }
        if (len == -1) {
          args_.emplace_back();
          if (--remaining_elements_ == 0) state_ = State::FrameComplete;
          break;
        }
        payload_length_ = static_cast<std::size_t>(len);
        state_ = State::ReadingElementPayload;
        break;
      }

      case State::ReadingElementPayload: {
        const std::size_t required = payload_length_ + 2;
        if (buffer_.size() - pos_ < required) return std::nullopt;
        if (buffer_[pos_ + payload_length_] != '\r' || buffer_[pos_ + payload_length_ + 1] != '\n') {
          throw ProtocolError("bulk payload longer than its declared length");
        }
        args_.emplace_back(buffer_.data() + pos_, payload_length_);
        pos_ += required;
        state_ = --remaining_elements_ == 0 ? State::FrameComplete : State::ReadingElementLength;
        break;
      }

      case State::FrameComplete: {
        state_ = State::AwaitingType;
        std::vector<std::string> out;
        out.swap(args_);
        return out;
      }
    }
  }
}

} // namespace emberkv
