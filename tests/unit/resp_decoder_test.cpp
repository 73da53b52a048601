#include "errors.hpp"
#include "protocol.hpp"

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

bool throws_protocol_error(const std::string& input) {
  emberkv::RequestDecoder decoder;
  decoder.feed(input);
  try {
    while (decoder.next().has_value()) {
    }
  } catch (const emberkv::ProtocolError&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  using Args = std::vector<std::string>;

  {
    emberkv::RequestDecoder decoder;
    decoder.feed("*1\r\n$4\r\nPING\r\n");
    const auto req = decoder.next();
    check(req.has_value() && *req == Args{"PING"}, "single PING frame");
    check(!decoder.next().has_value(), "no second frame");
    check(!decoder.has_partial(), "nothing left after a whole frame");
  }

  {
    // Every possible split point of a two-argument request.
    const std::string frame = "*2\r\n$4\r\nECHO\r\n$12\r\nhello\r\nworld\r\n";
    for (std::size_t cut = 0; cut <= frame.size(); ++cut) {
      emberkv::RequestDecoder decoder;
      decoder.feed(frame.substr(0, cut));
      auto req = decoder.next();
      if (cut < frame.size()) {
        check(!req.has_value(), "incomplete frame must not decode (cut " + std::to_string(cut) + ")");
        decoder.feed(frame.substr(cut));
        req = decoder.next();
      }
      check(req.has_value() && *req == Args{"ECHO", "hello\r\nworld"},
            "split frame decodes (cut " + std::to_string(cut) + ")");
    }
  }

  {
    // One byte at a time.
    const std::string frame = "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n";
    emberkv::RequestDecoder decoder;
    std::optional<std::vector<std::string>> req;
    for (char c : frame) {
      check(!req.has_value(), "frame completed too early");
      decoder.feed(std::string(1, c));
      req = decoder.next();
    }
    check(req.has_value() && *req == Args{"SET", "k", ""}, "byte-by-byte frame with empty bulk");
  }

  {
    emberkv::RequestDecoder decoder;
    decoder.feed("*1\r\n$4\r\nPING\r\n*2\r\n$3\r\nGET\r\n$1\r\na\r\n*1\r\n$4\r\nPI");
    const auto first = decoder.next();
    const auto second = decoder.next();
    check(first.has_value() && *first == Args{"PING"}, "pipelined first");
    check(second.has_value() && *second == Args{"GET", "a"}, "pipelined second");
    check(!decoder.next().has_value(), "pipelined third incomplete");
    check(decoder.has_partial(), "partial third frame buffered");
    bool threw = false;
    try {
      decoder.finish();
    } catch (const emberkv::ProtocolError&) {
      threw = true;
    }
    check(threw, "finish() reports a truncated frame");
  }

  {
    emberkv::RequestDecoder decoder;
    decoder.feed("PING\r\n\r\necho  hi \r\n");
    const auto a = decoder.next();
    const auto b = decoder.next();
    check(a.has_value() && *a == Args{"PING"}, "inline PING");
    check(b.has_value() && *b == Args{"echo", "hi"}, "inline with extra spaces, blank line skipped");
  }

  {
    emberkv::RequestDecoder decoder;
    decoder.feed("*-1\r\n*0\r\n*2\r\n$4\r\nECHO\r\n$-1\r\n");
    const auto req = decoder.next();
    check(req.has_value() && *req == Args{"ECHO", ""}, "null/empty arrays skipped, null bulk is empty arg");
    decoder.finish();
  }

  check(throws_protocol_error("*x\r\n"), "non-numeric array length");
  check(throws_protocol_error("*-2\r\n"), "negative array length");
  check(throws_protocol_error("*1\r\n$abc\r\n"), "non-numeric bulk length");
  check(throws_protocol_error("*1\r\n$-5\r\n"), "negative bulk length");
  check(throws_protocol_error("*1\r\n:4\r\n"), "element without '$'");
  check(throws_protocol_error("*1\r\n$2\r\nPING\r\n"), "payload longer than declared");
  check(throws_protocol_error("*1\r\n$999999999999\r\n"), "bulk length over the limit");
  check(throws_protocol_error("*" + std::string(emberkv::kMaxLineLength + 10, '1')), "header line too long");

  {
    // A huge declared element count waits for data without allocating for it up front.
    emberkv::RequestDecoder d;
    d.feed("*1048576\r\n$1\r\na\r\n");
    check(!d.next().has_value() && d.has_partial(), "max-length array header waits for elements");
    check(d.argument_capacity() <= 1024, "argument reservation is capped");
  }

  if (g_failures != 0) return 1;
  std::cout << "resp_decoder_test passed\n";
  return 0;
}
