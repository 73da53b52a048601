#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace emberkv {

inline const char* wrongtype_error_message() {
  return "Operation against a key holding the wrong kind of value";
}

// Malformed or truncated request framing. Always fatal for the connection.
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// A failure confined to one command. The dispatcher turns it into an error reply.
class CommandError : public std::runtime_error {
 public:
  CommandError(std::string kind, const std::string& message)
      : std::runtime_error(message), kind_(std::move(kind)) {}

  const std::string& kind() const { return kind_; }

 private:
  std::string kind_;
};

} // namespace emberkv
