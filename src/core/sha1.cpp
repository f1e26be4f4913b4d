#include "idforge/core/sha1.h"

#include <cstring>
#include <vector>

namespace idforge::core {

namespace {

// FIPS 180-4 §5.3.1: SHA-1 initial hash value.
constexpr std::array<std::uint32_t, 5> kH0 = {
    0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u, 0xc3d2e1f0u,
};

constexpr std::uint32_t rotl32(std::uint32_t x, unsigned n) noexcept {
  return (x << n) | (x >> (32u - n));
}

// Process one 512-bit (64-byte) block. Mutates state in place.
void process_block(std::array<std::uint32_t, 5>& state, const std::uint8_t* block) noexcept {
  std::array<std::uint32_t, 80> w{};

  // FIPS 180-4 §6.1.2 step 1: prepare message schedule.
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4u + 0u]) << 24u) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 8u) |
           (static_cast<std::uint32_t>(block[i * 4u + 3u]));
  }
  for (unsigned i = 16u; i < 80u; ++i) {
    w[i] = rotl32(w[i - 3u] ^ w[i - 8u] ^ w[i - 14u] ^ w[i - 16u], 1u);
  }

  std::uint32_t a = state[0];
  std::uint32_t b = state[1];
  std::uint32_t c = state[2];
  std::uint32_t d = state[3];
  std::uint32_t e = state[4];

  // FIPS 180-4 §4.1.1 / §4.2.1: functions and constants by round range.
  for (unsigned i = 0; i < 80u; ++i) {
    std::uint32_t f = 0;
    std::uint32_t k = 0;
    if (i < 20u) {
      f = (b & c) | (~b & d);
      k = 0x5a827999u;
    } else if (i < 40u) {
      f = b ^ c ^ d;
      k = 0x6ed9eba1u;
    } else if (i < 60u) {
      f = (b & c) | (b & d) | (c & d);
      k = 0x8f1bbcdcu;
    } else {
      f = b ^ c ^ d;
      k = 0xca62c1d6u;
    }
    const std::uint32_t t = rotl32(a, 5u) + f + e + k + w[i];
    e = d;
    d = c;
    c = rotl32(b, 30u);
    b = a;
    a = t;
  }

  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
  state[4] += e;
}

}  // namespace

Sha1Digest sha1_digest(std::string_view input) {
  // FIPS 180-4 §5.1.1: padding, identical to SHA-256.
  const std::uint64_t bit_len = static_cast<std::uint64_t>(input.size()) * 8u;
  const std::size_t padded_size = ((input.size() + 9u + 63u) / 64u) * 64u;

  std::vector<std::uint8_t> msg(padded_size, 0u);
  std::memcpy(msg.data(), input.data(), input.size());
  msg[input.size()] = 0x80u;
  for (unsigned i = 0; i < 8u; ++i) {
    msg[padded_size - 8u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }

  auto state = kH0;
  for (std::size_t offset = 0; offset < padded_size; offset += 64u) {
    process_block(state, msg.data() + offset);
  }

  Sha1Digest digest{};
  for (unsigned i = 0; i < 5u; ++i) {
    for (unsigned j = 0; j < 4u; ++j) {
      digest[i * 4u + j] = static_cast<std::uint8_t>(state[i] >> ((3u - j) * 8u));
    }
  }
  return digest;
}

}  // namespace idforge::core
