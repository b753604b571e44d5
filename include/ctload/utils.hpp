#ifndef CTLOAD_UTILS_HPP_
#define CTLOAD_UTILS_HPP_

#include <cstddef>
#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace ctload {

// ============================================================================
// Base64 encoding
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((size + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= size; i += 3) {
      uint32_t b = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8) |
                   static_cast<uint32_t>(data[i + 2]);
      out.push_back(kAlphabet[(b >> 18) & 0x3F]);
      out.push_back(kAlphabet[(b >> 12) & 0x3F]);
      out.push_back(kAlphabet[(b >> 6) & 0x3F]);
      out.push_back(kAlphabet[b & 0x3F]);
    }

    size_t rest = size - i;
    if (rest > 0) {
      uint32_t b = static_cast<uint32_t>(data[i]) << 16;
      if (rest == 2) b |= static_cast<uint32_t>(data[i + 1]) << 8;
      out.push_back(kAlphabet[(b >> 18) & 0x3F]);
      out.push_back(kAlphabet[(b >> 12) & 0x3F]);
      out.push_back(rest == 2 ? kAlphabet[(b >> 6) & 0x3F] : '=');
      out.push_back('=');
    }
    return out;
  }
};

// ============================================================================
// SHA-1 (only used for the WebSocket accept key)
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  void update(const uint8_t* data, size_t size) {
    total_bytes_ += size;
    for (size_t i = 0; i < size; ++i) {
      block_[block_len_++] = data[i];
      if (block_len_ == block_.size()) {
        process_block();
        block_len_ = 0;
      }
    }
  }

  Digest finalize() {
    uint64_t bit_len = total_bytes_ * 8;

    block_[block_len_++] = 0x80;
    if (block_len_ > 56) {
      while (block_len_ < 64) block_[block_len_++] = 0;
      process_block();
      block_len_ = 0;
    }
    while (block_len_ < 56) block_[block_len_++] = 0;
    for (int i = 0; i < 8; ++i) {
      block_[56 + i] = static_cast<uint8_t>(bit_len >> (8 * (7 - i)));
    }
    process_block();
    block_len_ = 0;

    Digest digest;
    for (size_t i = 0; i < 5; ++i) {
      digest[i * 4] = static_cast<uint8_t>(state_[i] >> 24);
      digest[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
      digest[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
      digest[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return digest;
  }

 private:
  std::array<uint32_t, 5> state_ = {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0};
  std::array<uint8_t, 64> block_{};
  size_t block_len_ = 0;
  uint64_t total_bytes_ = 0;

  static uint32_t rol(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void process_block() {
    std::array<uint32_t, 80> w;
    for (size_t i = 0; i < 16; ++i) {
      w[i] = (static_cast<uint32_t>(block_[i * 4]) << 24) | (static_cast<uint32_t>(block_[i * 4 + 1]) << 16) |
             (static_cast<uint32_t>(block_[i * 4 + 2]) << 8) | static_cast<uint32_t>(block_[i * 4 + 3]);
    }
    for (size_t i = 16; i < 80; ++i) {
      w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3], e = state_[4];
    for (size_t i = 0; i < 80; ++i) {
      uint32_t f, k;
      if (i < 20) {
        f = (b & c) | ((~b) & d);
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
      uint32_t temp = rol(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rol(b, 30);
      b = a;
      a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
  }
};

// ============================================================================
// WebSocket utilities (client side)
// ============================================================================

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

inline bool is_control(OpCode opcode) { return (static_cast<uint8_t>(opcode) & 0x08) != 0; }

struct FrameHeader {
  bool fin = false;
  uint8_t rsv = 0;
  OpCode opcode = OpCode::kContinuation;
  bool masked = false;
  uint64_t payload_len = 0;
  std::array<uint8_t, 4> mask_key{};
};

// Parse a frame header. Returns the header size, or 0 if more bytes are needed.
inline size_t parse_frame_header(std::string_view data, FrameHeader& header) {
  if (data.size() < 2) return 0;

  const auto byte_at = [&data](size_t i) { return static_cast<uint8_t>(data[i]); };

  header.fin = (byte_at(0) & 0x80) != 0;
  header.rsv = static_cast<uint8_t>((byte_at(0) >> 4) & 0x07);
  header.opcode = static_cast<OpCode>(byte_at(0) & 0x0F);
  header.masked = (byte_at(1) & 0x80) != 0;

  uint64_t len = byte_at(1) & 0x7F;
  size_t pos = 2;
  if (len == 126) {
    if (data.size() < 4) return 0;
    len = (static_cast<uint64_t>(byte_at(2)) << 8) | byte_at(3);
    pos = 4;
  } else if (len == 127) {
    if (data.size() < 10) return 0;
    len = 0;
    for (size_t i = 2; i < 10; ++i) len = (len << 8) | byte_at(i);
    pos = 10;
  }
  header.payload_len = len;

  if (header.masked) {
    if (data.size() < pos + 4) return 0;
    for (size_t i = 0; i < 4; ++i) header.mask_key[i] = byte_at(pos + i);
    pos += 4;
  }
  return pos;
}

// XOR payload with a 4-byte mask key (RFC 6455 5.3). Applying twice restores the input.
inline void apply_mask(uint8_t* payload, size_t len, const std::array<uint8_t, 4>& mask_key) {
  for (size_t i = 0; i < len; ++i) {
    payload[i] ^= mask_key[i % 4];
  }
}

// Encode a complete frame. Client frames must be masked.
inline std::vector<uint8_t> encode_frame(OpCode opcode, std::string_view payload, const std::array<uint8_t, 4>* mask_key) {
  std::vector<uint8_t> frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(opcode)));

  const uint8_t mask_bit = mask_key != nullptr ? 0x80 : 0x00;
  size_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<uint8_t>(mask_bit | len));
  } else if (len < 65536) {
    frame.push_back(static_cast<uint8_t>(mask_bit | 126));
    frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
  } else {
    frame.push_back(static_cast<uint8_t>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
  }

  size_t payload_pos = frame.size();
  if (mask_key != nullptr) {
    frame.insert(frame.end(), mask_key->begin(), mask_key->end());
    payload_pos += 4;
  }
  frame.insert(frame.end(), payload.begin(), payload.end());
  if (mask_key != nullptr) {
    apply_mask(frame.data() + payload_pos, len, *mask_key);
  }
  return frame;
}

// Sec-WebSocket-Accept value for a given Sec-WebSocket-Key.
inline std::string accept_key(std::string_view client_key) {
  constexpr std::string_view kMagic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  std::string key(client_key);
  key.append(kMagic);

  auto hash = SHA1::compute(reinterpret_cast<const uint8_t*>(key.data()), key.size());
  return Base64::encode(hash.data(), hash.size());
}

}  // namespace ws

}  // namespace ctload

#endif  // CTLOAD_UTILS_HPP_
