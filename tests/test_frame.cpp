#include "mws/frame.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <string>
#include <vector>

using namespace mws;
using namespace mws::ws;

namespace {

// What a browser sends: the server frame with MASK set and a key inserted.
std::string mask_as_client(const std::vector<uint8_t>& server_frame, const uint8_t mask[4]) {
  FrameHeader header{};
  std::string_view view(reinterpret_cast<const char*>(server_frame.data()), server_frame.size());
  size_t header_len = parse_frame_header(view, header);

  std::string out(view.substr(0, header_len));
  out[1] = static_cast<char>(static_cast<uint8_t>(out[1]) | 0x80);
  out.append(reinterpret_cast<const char*>(mask), 4);

  std::string payload(view.substr(header_len));
  apply_mask(reinterpret_cast<uint8_t*>(&payload[0]), payload.size(), mask);
  return out + payload;
}

std::string as_string(const std::vector<uint8_t>& bytes) { return std::string(bytes.begin(), bytes.end()); }

const uint8_t kMask[4] = {0x37, 0xfa, 0x21, 0x3d};

}  // namespace

// ============================================================================
// Header encoding
// ============================================================================

TEST_CASE("Frame - short text frame layout", "[frame]") {
  auto frame = encode_frame(OpCode::kText, "Hi");
  REQUIRE(frame == std::vector<uint8_t>{0x81, 0x02, 'H', 'i'});
}

TEST_CASE("Frame - length tiers", "[frame]") {
  SECTION("125 fits the 7-bit field") {
    auto frame = encode_frame(OpCode::kBinary, std::string(125, 'x'));
    REQUIRE(frame.size() == 2 + 125);
    REQUIRE(frame[0] == 0x82);
    REQUIRE(frame[1] == 125);
  }

  SECTION("126 uses the 16-bit field") {
    auto frame = encode_frame(OpCode::kBinary, std::string(126, 'x'));
    REQUIRE(frame.size() == 4 + 126);
    REQUIRE(frame[1] == 126);
    REQUIRE(frame[2] == 0x00);
    REQUIRE(frame[3] == 126);
  }

  SECTION("65535 still uses the 16-bit field") {
    auto frame = encode_frame(OpCode::kBinary, std::string(65535, 'x'));
    REQUIRE(frame.size() == 4 + 65535);
    REQUIRE(frame[1] == 126);
    REQUIRE(frame[2] == 0xFF);
    REQUIRE(frame[3] == 0xFF);
  }

  SECTION("65536 uses the 64-bit field") {
    auto frame = encode_frame(OpCode::kBinary, std::string(65536, 'x'));
    REQUIRE(frame.size() == 10 + 65536);
    REQUIRE(frame[1] == 127);
    const std::vector<uint8_t> len(frame.begin() + 2, frame.begin() + 10);
    REQUIRE(len == std::vector<uint8_t>{0, 0, 0, 0, 0, 1, 0, 0});
  }
}

TEST_CASE("Frame - server frames are never masked", "[frame]") {
  auto frame = encode_frame(OpCode::kText, std::string(300, 'a'));
  REQUIRE((frame[1] & 0x80) == 0);
}

TEST_CASE("Frame - parse_frame_header reads masked client header", "[frame]") {
  std::string wire = mask_as_client(encode_frame(OpCode::kText, "hello"), kMask);
  FrameHeader header{};
  size_t consumed = parse_frame_header(wire, header);

  REQUIRE(consumed == 6);
  REQUIRE(header.fin);
  REQUIRE(header.opcode == OpCode::kText);
  REQUIRE(header.masked);
  REQUIRE(header.payload_len == 5);
  REQUIRE(std::memcmp(header.mask_key, kMask, 4) == 0);
}

TEST_CASE("Frame - parse_frame_header incomplete input", "[frame]") {
  FrameHeader header{};
  REQUIRE(parse_frame_header(std::string_view("\x81", 1), header) == 0);
  // 16-bit length announced but missing
  REQUIRE(parse_frame_header(std::string_view("\x82\x7e\x01", 3), header) == 0);
  // Masked but key cut short
  REQUIRE(parse_frame_header(std::string_view("\x81\x85\x01\x02", 4), header) == 0);
}

// ============================================================================
// Masking
// ============================================================================

TEST_CASE("Frame - masking twice restores the payload", "[frame]") {
  std::string data = "The quick brown fox";
  std::string copy = data;
  apply_mask(reinterpret_cast<uint8_t*>(&copy[0]), copy.size(), kMask);
  REQUIRE(copy != data);
  apply_mask(reinterpret_cast<uint8_t*>(&copy[0]), copy.size(), kMask);
  REQUIRE(copy == data);
}

TEST_CASE("Frame - RFC 6455 masked Hello", "[frame]") {
  // RFC 6455 section 5.7
  const std::string wire("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11);
  auto decoded = decode_frame(wire);
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value().has_value());
  REQUIRE(decoded.value().value().opcode == OpCode::kText);
  REQUIRE(decoded.value().value().payload == "Hello");
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("Frame - decode recovers payload at every length tier", "[frame]") {
  for (size_t len : {size_t{0}, size_t{1}, size_t{125}, size_t{126}, size_t{65535}, size_t{65536}}) {
    std::string payload(len, '\0');
    for (size_t i = 0; i < len; ++i) {
      payload[i] = static_cast<char>(i * 31 + 7);
    }

    auto decoded = decode_frame(mask_as_client(encode_frame(OpCode::kBinary, payload), kMask));
    REQUIRE(decoded.has_value());
    REQUIRE(decoded.value().has_value());
    REQUIRE(decoded.value().value().opcode == OpCode::kBinary);
    REQUIRE(decoded.value().value().payload == payload);
  }
}

TEST_CASE("Frame - decode binary bytes", "[frame]") {
  auto decoded = decode_frame(mask_as_client(encode_frame(OpCode::kBinary, std::string("\x01\x02\x03", 3)), kMask));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value().value().payload == std::string("\x01\x02\x03", 3));
}

TEST_CASE("Frame - empty input is no message", "[frame]") {
  auto decoded = decode_frame("");
  REQUIRE(decoded.has_value());
  REQUIRE(!decoded.value().has_value());
}

TEST_CASE("Frame - close sentinel is no message whatever the opcode", "[frame]") {
  const std::string sentinel("\x03\xe9", 2);
  for (OpCode op : {OpCode::kClose, OpCode::kText, OpCode::kBinary}) {
    auto decoded = decode_frame(mask_as_client(encode_frame(op, sentinel), kMask));
    REQUIRE(decoded.has_value());
    REQUIRE(!decoded.value().has_value());
  }
}

TEST_CASE("Frame - other close payloads are delivered", "[frame]") {
  // Status 1000 is not the sentinel
  auto decoded = decode_frame(mask_as_client(encode_frame(OpCode::kClose, std::string("\x03\xe8", 2)), kMask));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value().has_value());
  REQUIRE(decoded.value().value().opcode == OpCode::kClose);
}

TEST_CASE("Frame - truncated input is a parse error", "[frame]") {
  std::string wire = mask_as_client(encode_frame(OpCode::kText, "truncate me"), kMask);

  SECTION("header only") {
    auto decoded = decode_frame(wire.substr(0, 1));
    REQUIRE(!decoded.has_value());
    REQUIRE(decoded.get_error() == ErrorCode::kFrameParseError);
  }

  SECTION("mask cut short") {
    REQUIRE(!decode_frame(wire.substr(0, 4)).has_value());
  }

  SECTION("payload cut short") {
    REQUIRE(!decode_frame(wire.substr(0, wire.size() - 1)).has_value());
  }

  SECTION("extended length cut short") {
    REQUIRE(!decode_frame(std::string("\x82\xff\x00\x00", 4)).has_value());
  }
}

TEST_CASE("Frame - trailing bytes after the payload are ignored", "[frame]") {
  std::string wire = mask_as_client(encode_frame(OpCode::kText, "one"), kMask) + "garbage";
  auto decoded = decode_frame(wire);
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value().value().payload == "one");
}

// ============================================================================
// Messages and deltas
// ============================================================================

TEST_CASE("Message - text and binary opcodes", "[frame]") {
  auto text = encode_message(Message::text("Welcome!"));
  REQUIRE(text[0] == 0x81);
  REQUIRE(as_string(text).substr(2) == "Welcome!");

  auto bin = encode_message(Message::binary(std::string("\x00\xff", 2)));
  REQUIRE(bin[0] == 0x82);
  REQUIRE(bin.size() == 4);
}

TEST_CASE("Delta - byte layout", "[frame]") {
  Delta delta;
  delta.updates = {{"a", "1"}, {"bb", "22"}};
  delta.deletes = {"c"};

  // clang-format off
  const std::vector<uint8_t> expected_layout = {
      0x00, 0x00, 0x00, 0x02,
      0x82, 0x01, 'a',
      0x82, 0x01, '1',
      0x82, 0x02, 'b', 'b',
      0x82, 0x02, '2', '2',
      0x00, 0x00, 0x00, 0x01,
      0x82, 0x01, 'c',
  };
  // clang-format on
  REQUIRE(flatten_delta(delta) == expected_layout);

  auto frame = encode_message(Message::delta(delta));
  REQUIRE(frame[0] == 0x82);
  REQUIRE(frame[1] == expected_layout.size());
  REQUIRE(std::vector<uint8_t>(frame.begin() + 2, frame.end()) == expected_layout);
}

TEST_CASE("Delta - empty delta is two zero counts", "[frame]") {
  REQUIRE(flatten_delta(Delta{}) == std::vector<uint8_t>(8, 0));
}

TEST_CASE("Delta - long values use extended nested lengths", "[frame]") {
  Delta delta;
  delta.updates = {{"big", std::string(300, 'v')}};
  auto flat = flatten_delta(delta);
  // count(4) + "big" field(2+3) + value header
  REQUIRE(flat[9] == 0x82);
  REQUIRE(flat[10] == 126);
  REQUIRE(flat[11] == 0x01);
  REQUIRE(flat[12] == 0x2C);

  auto parsed = parse_delta(std::string_view(reinterpret_cast<const char*>(flat.data()), flat.size()));
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value().updates[0].second.size() == 300);
}

TEST_CASE("Delta - parse restores updates and deletes in order", "[frame]") {
  Delta delta;
  delta.updates = {{"x", "10"}, {"y", ""}, {std::string("\x00k", 2), "v"}};
  delta.deletes = {"old", "older"};
  auto flat = flatten_delta(delta);

  auto parsed = parse_delta(std::string_view(reinterpret_cast<const char*>(flat.data()), flat.size()));
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value().updates == delta.updates);
  REQUIRE(parsed.value().deletes == delta.deletes);
}

TEST_CASE("Delta - parse rejects truncated or padded input", "[frame]") {
  Delta delta;
  delta.updates = {{"k", "v"}};
  auto flat = flatten_delta(delta);
  std::string bytes(flat.begin(), flat.end());

  REQUIRE(!parse_delta(bytes.substr(0, 3)).has_value());
  REQUIRE(!parse_delta(bytes.substr(0, bytes.size() - 1)).has_value());
  REQUIRE(parse_delta(bytes + "x").get_error() == ErrorCode::kFrameParseError);
}
