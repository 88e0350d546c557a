#include "mws/crypto.hpp"

namespace mws {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 0..63 for alphabet characters, 64 for anything else.
constexpr uint8_t kInvalid = 64;

uint8_t sextet(char c) {
  if (c >= 'A' && c <= 'Z')
    return static_cast<uint8_t>(c - 'A');
  if (c >= 'a' && c <= 'z')
    return static_cast<uint8_t>(c - 'a' + 26);
  if (c >= '0' && c <= '9')
    return static_cast<uint8_t>(c - '0' + 52);
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return kInvalid;
}

inline uint32_t rotl(uint32_t x, int n) {
  return (x << n) | (x >> (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

}  // namespace

// ============================================================================
// Base64
// ============================================================================

std::string Base64::encode(const uint8_t* data, size_t size) {
  std::string out;
  out.reserve((size + 2) / 3 * 4);

  size_t i = 0;
  for (; i + 3 <= size; i += 3) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8) |
                      static_cast<uint32_t>(data[i + 2]);
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    out.push_back(kAlphabet[triple & 0x3F]);
  }

  size_t rest = size - i;
  if (rest == 1) {
    uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.append("==");
  } else if (rest == 2) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::vector<uint8_t> Base64::decode(std::string_view encoded) {
  std::vector<uint8_t> out;
  if (encoded.size() % 4 != 0)
    return out;
  out.reserve(encoded.size() / 4 * 3);

  for (size_t i = 0; i < encoded.size(); i += 4) {
    uint8_t a = sextet(encoded[i]);
    uint8_t b = sextet(encoded[i + 1]);
    if (a == kInvalid || b == kInvalid)
      return {};

    uint32_t quad = (static_cast<uint32_t>(a) << 18) | (static_cast<uint32_t>(b) << 12);
    out.push_back(static_cast<uint8_t>((quad >> 16) & 0xFF));
    if (encoded[i + 2] == '=')
      break;

    uint8_t c = sextet(encoded[i + 2]);
    if (c == kInvalid)
      return {};
    quad |= static_cast<uint32_t>(c) << 6;
    out.push_back(static_cast<uint8_t>((quad >> 8) & 0xFF));
    if (encoded[i + 3] == '=')
      break;

    uint8_t d = sextet(encoded[i + 3]);
    if (d == kInvalid)
      return {};
    quad |= d;
    out.push_back(static_cast<uint8_t>(quad & 0xFF));
  }
  return out;
}

// ============================================================================
// SHA1
// ============================================================================

std::string SHA1::hex_digest(std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";
  Digest digest = compute(input);
  std::string hex;
  hex.reserve(digest.size() * 2);
  for (uint8_t byte : digest) {
    hex.push_back(kHex[byte >> 4]);
    hex.push_back(kHex[byte & 0x0F]);
  }
  return hex;
}

void SHA1::update(const uint8_t* data, size_t size) {
  total_bytes_ += size;
  for (size_t i = 0; i < size; ++i) {
    block_[block_len_++] = data[i];
    if (block_len_ == kBlockSize) {
      process_block(block_.data());
      block_len_ = 0;
    }
  }
}

SHA1::Digest SHA1::finalize() {
  const uint64_t total_bits = total_bytes_ * 8;

  block_[block_len_++] = 0x80;
  if (block_len_ > kBlockSize - 8) {
    while (block_len_ < kBlockSize)
      block_[block_len_++] = 0;
    process_block(block_.data());
    block_len_ = 0;
  }
  while (block_len_ < kBlockSize - 8)
    block_[block_len_++] = 0;

  for (int i = 7; i >= 0; --i) {
    block_[block_len_++] = static_cast<uint8_t>((total_bits >> (8 * i)) & 0xFF);
  }
  process_block(block_.data());
  block_len_ = 0;

  Digest digest{};
  for (size_t i = 0; i < state_.size(); ++i) {
    digest[i * 4] = static_cast<uint8_t>((state_[i] >> 24) & 0xFF);
    digest[i * 4 + 1] = static_cast<uint8_t>((state_[i] >> 16) & 0xFF);
    digest[i * 4 + 2] = static_cast<uint8_t>((state_[i] >> 8) & 0xFF);
    digest[i * 4 + 3] = static_cast<uint8_t>(state_[i] & 0xFF);
  }
  return digest;
}

void SHA1::process_block(const uint8_t* block) {
  std::array<uint32_t, 80> w;
  for (int i = 0; i < 16; ++i) {
    w[i] = load_be32(block + i * 4);
  }
  for (int i = 16; i < 80; ++i) {
    w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
  }

  uint32_t a = state_[0];
  uint32_t b = state_[1];
  uint32_t c = state_[2];
  uint32_t d = state_[3];
  uint32_t e = state_[4];

  for (int i = 0; i < 80; ++i) {
    uint32_t f;
    uint32_t k;
    if (i < 20) {
      f = (b & c) | (~b & d);
      k = 0x5a827999;
    } else if (i < 40) {
      f = b ^ c ^ d;
      k = 0x6ed9eba1;
    } else if (i < 60) {
      f = (b & c) | (b & d) | (c & d);
      k = 0x8f1bbcdc;
    } else {
      f = b ^ c ^ d;
      k = 0xca62c1d6;
    }

    uint32_t t = rotl(a, 5) + f + e + k + w[i];
    e = d;
    d = c;
    c = rotl(b, 30);
    b = a;
    a = t;
  }

  state_[0] += a;
  state_[1] += b;
  state_[2] += c;
  state_[3] += d;
  state_[4] += e;
}

}  // namespace mws
