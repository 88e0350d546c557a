#include "mws/frame.hpp"

#include <cstring>

namespace mws {
namespace ws {

namespace {

// Reads the 7-bit length indicator and any extended length.
// Returns the offset just past the length field, or 0 if incomplete.
size_t read_length(std::string_view data, uint64_t& len) {
  if (data.size() < 2)
    return 0;

  const auto* p = reinterpret_cast<const uint8_t*>(data.data());
  len = p[1] & 0x7F;

  if (len == 126) {
    if (data.size() < 4)
      return 0;
    len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
    return 4;
  }
  if (len == 127) {
    if (data.size() < 10)
      return 0;
    len = 0;
    for (size_t i = 2; i < 10; ++i) {
      len = (len << 8) | p[i];
    }
    return 10;
  }
  return 2;
}

void append_be32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void append_field(std::vector<uint8_t>& out, std::string_view field) {
  uint8_t header[kMaxHeaderSize];
  size_t header_len = encode_frame_header(header, OpCode::kBinary, field.size());
  out.insert(out.end(), header, header + header_len);
  out.insert(out.end(), field.begin(), field.end());
}

// Cursor over a flattened delta
class DeltaReader {
 public:
  explicit DeltaReader(std::string_view data) : data_(data) {}

  bool read_count(uint32_t& count) {
    if (data_.size() - pos_ < 4)
      return false;
    const auto* p = reinterpret_cast<const uint8_t*>(data_.data() + pos_);
    count = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
            (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    pos_ += 4;
    return true;
  }

  bool read_field(std::string& field) {
    std::string_view rest = data_.substr(pos_);
    uint64_t len = 0;
    size_t header_len = read_length(rest, len);
    if (header_len == 0 || rest.size() - header_len < len)
      return false;
    field.assign(rest.data() + header_len, static_cast<size_t>(len));
    pos_ += header_len + static_cast<size_t>(len);
    return true;
  }

  bool at_end() const { return pos_ == data_.size(); }

 private:
  std::string_view data_;
  size_t pos_ = 0;
};

}  // namespace

size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  uint64_t len = 0;
  size_t header_size = read_length(data, len);
  if (header_size == 0)
    return 0;

  const auto* p = reinterpret_cast<const uint8_t*>(data.data());
  header.fin = (p[0] & 0x80) != 0;
  header.opcode = static_cast<OpCode>(p[0] & 0x0F);
  header.masked = (p[1] & 0x80) != 0;
  header.payload_len = len;
  std::memset(header.mask_key, 0, sizeof(header.mask_key));

  if (header.masked) {
    if (data.size() < header_size + 4)
      return 0;
    std::memcpy(header.mask_key, p + header_size, 4);
    header_size += 4;
  }

  return header_size;
}

size_t encode_frame_header(uint8_t* buf, OpCode opcode, uint64_t payload_len) {
  size_t pos = 0;
  buf[pos++] = static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode));

  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else if (payload_len <= 0xFFFF) {
    buf[pos++] = 126;
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = 127;
    for (int i = 7; i >= 0; --i) {
      buf[pos++] = static_cast<uint8_t>((payload_len >> (8 * i)) & 0xFF);
    }
  }
  return pos;
}

std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload) {
  uint8_t header[kMaxHeaderSize];
  size_t header_len = encode_frame_header(header, opcode, payload.size());

  std::vector<uint8_t> frame;
  frame.reserve(header_len + payload.size());
  frame.insert(frame.end(), header, header + header_len);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

void apply_mask(uint8_t* data, size_t len, const uint8_t* mask_key) {
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= mask_key[i % 4];
  }
}

std::vector<uint8_t> flatten_delta(const Delta& delta) {
  std::vector<uint8_t> out;

  append_be32(out, static_cast<uint32_t>(delta.updates.size()));
  for (const auto& kv : delta.updates) {
    append_field(out, kv.first);
    append_field(out, kv.second);
  }

  append_be32(out, static_cast<uint32_t>(delta.deletes.size()));
  for (const auto& key : delta.deletes) {
    append_field(out, key);
  }
  return out;
}

expected<Delta, ErrorCode> parse_delta(std::string_view data) {
  DeltaReader reader(data);
  Delta delta;

  uint32_t count = 0;
  if (!reader.read_count(count))
    return expected<Delta, ErrorCode>::error(ErrorCode::kFrameParseError);
  for (uint32_t i = 0; i < count; ++i) {
    std::string key;
    std::string value;
    if (!reader.read_field(key) || !reader.read_field(value))
      return expected<Delta, ErrorCode>::error(ErrorCode::kFrameParseError);
    delta.updates.emplace_back(std::move(key), std::move(value));
  }

  if (!reader.read_count(count))
    return expected<Delta, ErrorCode>::error(ErrorCode::kFrameParseError);
  for (uint32_t i = 0; i < count; ++i) {
    std::string key;
    if (!reader.read_field(key))
      return expected<Delta, ErrorCode>::error(ErrorCode::kFrameParseError);
    delta.deletes.push_back(std::move(key));
  }

  if (!reader.at_end())
    return expected<Delta, ErrorCode>::error(ErrorCode::kFrameParseError);
  return expected<Delta, ErrorCode>::success(std::move(delta));
}

std::vector<uint8_t> encode_message(const Message& message) {
  switch (message.kind()) {
    case Message::Kind::kText:
      return encode_frame(OpCode::kText, message.payload());
    case Message::Kind::kBinary:
      return encode_frame(OpCode::kBinary, message.payload());
    case Message::Kind::kDelta: {
      std::vector<uint8_t> flat = flatten_delta(message.get_delta());
      return encode_frame(OpCode::kBinary,
                          std::string_view(reinterpret_cast<const char*>(flat.data()), flat.size()));
    }
  }
  return {};
}

expected<optional<DecodedFrame>, ErrorCode> decode_frame(std::string_view data) {
  using Result = expected<optional<DecodedFrame>, ErrorCode>;

  if (data.empty())
    return Result::success(optional<DecodedFrame>());

  uint64_t payload_len = 0;
  size_t mask_pos = read_length(data, payload_len);
  if (mask_pos == 0 || data.size() < mask_pos + 4)
    return Result::error(ErrorCode::kFrameParseError);

  size_t payload_pos = mask_pos + 4;
  if (data.size() - payload_pos < payload_len)
    return Result::error(ErrorCode::kFrameParseError);

  const auto* mask_key = reinterpret_cast<const uint8_t*>(data.data() + mask_pos);
  DecodedFrame frame;
  frame.opcode = static_cast<OpCode>(static_cast<uint8_t>(data[0]) & 0x0F);
  frame.payload.assign(data.data() + payload_pos, static_cast<size_t>(payload_len));
  apply_mask(reinterpret_cast<uint8_t*>(&frame.payload[0]), frame.payload.size(), mask_key);

  if (frame.payload.size() == sizeof(kCloseSentinel) &&
      std::memcmp(frame.payload.data(), kCloseSentinel, sizeof(kCloseSentinel)) == 0) {
    return Result::success(optional<DecodedFrame>());
  }
  return Result::success(optional<DecodedFrame>(std::move(frame)));
}

}  // namespace ws
}  // namespace mws
