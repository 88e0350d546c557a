#ifndef MWS_FRAME_HPP_
#define MWS_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mws {
namespace ws {

// Frame types
enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

// Largest header a frame can carry: 2 base + 8 extended length + 4 mask.
constexpr size_t kMaxHeaderSize = 14;

// Close status 1001 ("going away") with no reason text, as browsers send it
// when the page unloads. Decoding it yields no message.
constexpr uint8_t kCloseSentinel[2] = {0x03, 0xE9};

struct FrameHeader {
  bool fin;
  OpCode opcode;
  bool masked;
  uint64_t payload_len;
  uint8_t mask_key[4];
};

// Parse WebSocket frame header from buffer
// Returns bytes consumed (including the mask key when present), or 0 if incomplete
size_t parse_frame_header(std::string_view data, FrameHeader& header);

// Encode a server frame header (FIN set, never masked) into buf
// buf must hold kMaxHeaderSize bytes. Returns the header length.
size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len);

// Encode a complete, unfragmented, unmasked frame
std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload);

// XOR data in place with mask[i % 4]. Applying it twice restores the input.
void apply_mask(uint8_t* data, size_t len, const uint8_t* mask_key);

// ============================================================================
// Application messages
// ============================================================================

/**
 * @brief Incremental key/value state update.
 *
 * Keys and values are arbitrary byte strings. On the wire the delta is a
 * 4-byte big-endian update count, each key and value as a nested binary
 * frame, a 4-byte delete count, then each deleted key as a nested frame.
 */
struct Delta {
  std::vector<std::pair<std::string, std::string>> updates;
  std::vector<std::string> deletes;
};

/**
 * @brief Outbound application message: text, binary, or delta.
 */
class Message {
 public:
  enum class Kind : uint8_t { kText, kBinary, kDelta };

  static Message text(std::string_view utf8) { return Message(Kind::kText, std::string(utf8)); }

  static Message binary(std::string_view bytes) { return Message(Kind::kBinary, std::string(bytes)); }

  static Message delta(Delta d) {
    Message m(Kind::kDelta, std::string());
    m.delta_ = std::move(d);
    return m;
  }

  Kind kind() const { return kind_; }

  // Text or binary payload; empty for deltas
  const std::string& payload() const { return payload_; }

  const Delta& get_delta() const { return delta_; }

 private:
  Message(Kind kind, std::string payload) : kind_(kind), payload_(std::move(payload)) {}

  Kind kind_;
  std::string payload_;
  Delta delta_;
};

// Flatten a delta into its binary layout (no outer frame)
std::vector<uint8_t> flatten_delta(const Delta& delta);

// Inverse of flatten_delta. error(kFrameParseError) on truncated or malformed input.
expected<Delta, ErrorCode> parse_delta(std::string_view data);

// Encode an application message as a single frame: text uses opcode 1,
// binary and delta use opcode 2.
std::vector<uint8_t> encode_message(const Message& message);

// ============================================================================
// Inbound decoding
// ============================================================================

struct DecodedFrame {
  OpCode opcode;
  std::string payload;  // unmasked
};

/**
 * @brief Decode one client frame.
 *
 * The four bytes after the length field are always taken as the mask key.
 * Returns an empty optional ("no message") for empty input and for the close
 * sentinel payload, whatever the opcode. Returns error(kFrameParseError) if
 * the header, mask or payload is truncated. Bytes past the declared payload
 * length are ignored.
 */
expected<optional<DecodedFrame>, ErrorCode> decode_frame(std::string_view data);

}  // namespace ws
}  // namespace mws

#endif  // MWS_FRAME_HPP_
