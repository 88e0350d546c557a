#include "mws/handshake.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace mws;
using namespace mws::ws;

namespace {

const char* kBrowserRequest =
    "GET /chat HTTP/1.1\r\n"
    "Host: server.example.com\r\n"
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
    "Origin: http://example.com\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "\r\n";

}  // namespace

TEST_CASE("Handshake - accept key matches RFC 6455 example", "[handshake]") {
  REQUIRE(generate_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Handshake - find key in a browser request", "[handshake]") {
  auto key = find_client_key(kBrowserRequest);
  REQUIRE(key.has_value());
  REQUIRE(key.value() == "dGhlIHNhbXBsZSBub25jZQ==");
}

TEST_CASE("Handshake - header name is case-insensitive", "[handshake]") {
  auto key = find_client_key("GET / HTTP/1.1\r\nsec-websocket-key: abc==\r\n\r\n");
  REQUIRE(key.has_value());
  REQUIRE(key.value() == "abc==");
}

TEST_CASE("Handshake - value whitespace is trimmed", "[handshake]") {
  auto key = find_client_key("GET / HTTP/1.1\r\nSec-WebSocket-Key:   spaced==  \r\n\r\n");
  REQUIRE(key.has_value());
  REQUIRE(key.value() == "spaced==");
}

TEST_CASE("Handshake - key on the last line without CRLF", "[handshake]") {
  auto key = find_client_key("GET / HTTP/1.1\r\nSec-WebSocket-Key: tail==");
  REQUIRE(key.has_value());
  REQUIRE(key.value() == "tail==");
}

TEST_CASE("Handshake - missing or blank key", "[handshake]") {
  REQUIRE(!find_client_key("GET / HTTP/1.1\r\nHost: x\r\n\r\n").has_value());
  REQUIRE(!find_client_key("GET / HTTP/1.1\r\nSec-WebSocket-Key:\r\n\r\n").has_value());
  REQUIRE(!find_client_key("").has_value());
}

TEST_CASE("Handshake - similarly named headers do not match", "[handshake]") {
  REQUIRE(!find_client_key("GET / HTTP/1.1\r\nSec-WebSocket-Key-Extra: nope\r\n\r\n").has_value());
  REQUIRE(!find_client_key("GET / HTTP/1.1\r\nSec-WebSocket-Version: 13\r\n\r\n").has_value());
}

TEST_CASE("Handshake - upgrade response layout", "[handshake]") {
  auto response = process_handshake(kBrowserRequest);
  REQUIRE(response.has_value());
  REQUIRE(response.value() ==
          "HTTP/1.1 101 Switching Protocols\r\n"
          "Upgrade: websocket\r\n"
          "Connection: Upgrade\r\n"
          "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
          "\r\n");
}

TEST_CASE("Handshake - request without key is rejected", "[handshake]") {
  auto response = process_handshake("GET / HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\n\r\n");
  REQUIRE(!response.has_value());
  REQUIRE(response.get_error() == ErrorCode::kHandshakeFailed);
  REQUIRE(kRejectResponse == "HTTP/1.1 400 Bad Request\r\n\r\n");
}
