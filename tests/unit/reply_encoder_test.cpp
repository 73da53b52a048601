#include "protocol.hpp"

#include <iostream>
#include <string>

namespace {

int g_failures = 0;

void expect_encoding(const emberkv::Reply& reply, const std::string& wire, const std::string& what) {
  const std::string got = emberkv::encode_reply(reply);
  if (got != wire) {
    std::cerr << "FAILED: " << what << ": got '" << got << "'\n";
    ++g_failures;
  }
}

}  // namespace

int main() {
  using emberkv::Reply;

  expect_encoding(Reply::status("PONG"), "+PONG\r\n", "status");
  expect_encoding(Reply::error("WRONGTYPE", "bad"), "-WRONGTYPE bad\r\n", "error");
  expect_encoding(Reply::integer_value(-42), ":-42\r\n", "integer");
  expect_encoding(Reply::bulk("a\r\nb"), "$4\r\na\r\nb\r\n", "bulk with CRLF inside");
  expect_encoding(Reply::bulk(""), "$0\r\n\r\n", "empty bulk");
  expect_encoding(Reply::null_bulk(), "$-1\r\n", "null bulk");
  expect_encoding(Reply::array({}), "*0\r\n", "empty array");
  expect_encoding(Reply::null_array(), "*-1\r\n", "null array");
  expect_encoding(Reply::none(), "", "no reply");
  expect_encoding(Reply::array({Reply::bulk("1-0"), Reply::bulk_array({"f", "v"})}),
                  "*2\r\n$3\r\n1-0\r\n*2\r\n$1\r\nf\r\n$1\r\nv\r\n", "nested array");

  if (Reply::error("ERR", "x y").error_kind() != "ERR") {
    std::cerr << "FAILED: error_kind\n";
    ++g_failures;
  }

  if (g_failures != 0) return 1;
  std::cout << "reply_encoder_test passed\n";
  return 0;
}
