#ifndef MWS_CRYPTO_HPP_
#define MWS_CRYPTO_HPP_

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace mws {

// ============================================================================
// Base64 encoding/decoding (RFC 4648 standard alphabet, padded)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size);

  static std::string encode(std::string_view data) {
    return encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  }

  // Returns an empty vector if the input length is not a multiple of 4.
  static std::vector<uint8_t> decode(std::string_view encoded);
};

// ============================================================================
// SHA-1 hashing (handshake accept token only, not for security use)
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  SHA1() = default;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  static Digest compute(std::string_view data) {
    return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  }

  static std::string hex_digest(std::string_view input);

  void update(const uint8_t* data, size_t size);

  // Pads, processes the final block(s) and returns the digest.
  // The hasher must not be updated afterwards.
  Digest finalize();

 private:
  static constexpr size_t kBlockSize = 64;

  std::array<uint32_t, 5> state_ = {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0};
  std::array<uint8_t, kBlockSize> block_{};
  size_t block_len_ = 0;
  uint64_t total_bytes_ = 0;

  void process_block(const uint8_t* block);
};

}  // namespace mws

#endif  // MWS_CRYPTO_HPP_
