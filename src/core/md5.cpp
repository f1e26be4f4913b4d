#include "idforge/core/md5.h"

#include <cstring>
#include <vector>

namespace idforge::core {

namespace {

// RFC 1321 §3.4: per-round shift amounts.
constexpr std::array<std::uint32_t, 64> kShift = {
    7u, 12u, 17u, 22u, 7u, 12u, 17u, 22u, 7u, 12u, 17u, 22u, 7u, 12u, 17u, 22u,
    5u, 9u,  14u, 20u, 5u, 9u,  14u, 20u, 5u, 9u,  14u, 20u, 5u, 9u,  14u, 20u,
    4u, 11u, 16u, 23u, 4u, 11u, 16u, 23u, 4u, 11u, 16u, 23u, 4u, 11u, 16u, 23u,
    6u, 10u, 15u, 21u, 6u, 10u, 15u, 21u, 6u, 10u, 15u, 21u, 6u, 10u, 15u, 21u,
};

// RFC 1321 §3.4: T[i] = floor(2^32 * abs(sin(i + 1))).
constexpr std::array<std::uint32_t, 64> kT = {
    0xd76aa478u, 0xe8c7b756u, 0x242070dbu, 0xc1bdceeeu, 0xf57c0fafu, 0x4787c62au, 0xa8304613u,
    0xfd469501u, 0x698098d8u, 0x8b44f7afu, 0xffff5bb1u, 0x895cd7beu, 0x6b901122u, 0xfd987193u,
    0xa679438eu, 0x49b40821u, 0xf61e2562u, 0xc040b340u, 0x265e5a51u, 0xe9b6c7aau, 0xd62f105du,
    0x02441453u, 0xd8a1e681u, 0xe7d3fbc8u, 0x21e1cde6u, 0xc33707d6u, 0xf4d50d87u, 0x455a14edu,
    0xa9e3e905u, 0xfcefa3f8u, 0x676f02d9u, 0x8d2a4c8au, 0xfffa3942u, 0x8771f681u, 0x6d9d6122u,
    0xfde5380cu, 0xa4beea44u, 0x4bdecfa9u, 0xf6bb4b60u, 0xbebfbc70u, 0x289b7ec6u, 0xeaa127fau,
    0xd4ef3085u, 0x04881d05u, 0xd9d4d039u, 0xe6db99e5u, 0x1fa27cf8u, 0xc4ac5665u, 0xf4292244u,
    0x432aff97u, 0xab9423a7u, 0xfc93a039u, 0x655b59c3u, 0x8f0ccc92u, 0xffeff47du, 0x85845dd1u,
    0x6fa87e4fu, 0xfe2ce6e0u, 0xa3014314u, 0x4e0811a1u, 0xf7537e82u, 0xbd3af235u, 0x2ad7d2bbu,
    0xeb86d391u,
};

constexpr std::uint32_t rotl32(std::uint32_t x, std::uint32_t n) noexcept {
  return (x << n) | (x >> (32u - n));
}

// Process one 512-bit (64-byte) block. Mutates state in place.
void process_block(std::array<std::uint32_t, 4>& state, const std::uint8_t* block) noexcept {
  std::array<std::uint32_t, 16> m{};
  // MD5 words are little-endian.
  for (unsigned i = 0; i < 16u; ++i) {
    m[i] = (static_cast<std::uint32_t>(block[i * 4u + 0u])) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 8u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 3u]) << 24u);
  }

  std::uint32_t a = state[0];
  std::uint32_t b = state[1];
  std::uint32_t c = state[2];
  std::uint32_t d = state[3];

  for (unsigned i = 0; i < 64u; ++i) {
    std::uint32_t f = 0;
    unsigned g = 0;
    if (i < 16u) {
      f = (b & c) | (~b & d);
      g = i;
    } else if (i < 32u) {
      f = (d & b) | (~d & c);
      g = (5u * i + 1u) % 16u;
    } else if (i < 48u) {
      f = b ^ c ^ d;
      g = (3u * i + 5u) % 16u;
    } else {
      f = c ^ (b | ~d);
      g = (7u * i) % 16u;
    }
    const std::uint32_t tmp = d;
    d = c;
    c = b;
    b = b + rotl32(a + f + kT[i] + m[g], kShift[i]);
    a = tmp;
  }

  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
}

}  // namespace

Md5Digest md5_digest(std::string_view input) {
  // RFC 1321 §3.1-3.2: pad to 56 mod 64, then append 64-bit little-endian bit length.
  const std::uint64_t bit_len = static_cast<std::uint64_t>(input.size()) * 8u;
  const std::size_t padded_size = ((input.size() + 9u + 63u) / 64u) * 64u;

  std::vector<std::uint8_t> msg(padded_size, 0u);
  std::memcpy(msg.data(), input.data(), input.size());
  msg[input.size()] = 0x80u;
  for (unsigned i = 0; i < 8u; ++i) {
    msg[padded_size - 8u + i] = static_cast<std::uint8_t>(bit_len >> (i * 8u));
  }

  // RFC 1321 §3.3: initial buffer.
  std::array<std::uint32_t, 4> state = {0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u};
  for (std::size_t offset = 0; offset < padded_size; offset += 64u) {
    process_block(state, msg.data() + offset);
  }

  Md5Digest digest{};
  for (unsigned i = 0; i < 4u; ++i) {
    for (unsigned j = 0; j < 4u; ++j) {
      digest[i * 4u + j] = static_cast<std::uint8_t>(state[i] >> (j * 8u));
    }
  }
  return digest;
}

}  // namespace idforge::core
