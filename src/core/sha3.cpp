#include "idforge/core/sha3.h"

namespace idforge::core {

namespace {

constexpr std::size_t kRateBytes = 72;  // 1600 - 2 * 512 bits
constexpr unsigned kRounds = 24;

// FIPS 202 §3.2.5: round constants for ι.
constexpr std::array<std::uint64_t, kRounds> kRoundConstants = {
    0x0000000000000001ull, 0x0000000000008082ull, 0x800000000000808aull, 0x8000000080008000ull,
    0x000000000000808bull, 0x0000000080000001ull, 0x8000000080008081ull, 0x8000000000008009ull,
    0x000000000000008aull, 0x0000000000000088ull, 0x0000000080008009ull, 0x000000008000000aull,
    0x000000008000808bull, 0x800000000000008bull, 0x8000000000008089ull, 0x8000000000008003ull,
    0x8000000000008002ull, 0x8000000000000080ull, 0x000000000000800aull, 0x800000008000000aull,
    0x8000000080008081ull, 0x8000000000008080ull, 0x0000000080000001ull, 0x8000000080008008ull,
};

// FIPS 202 §3.2.2: ρ offsets, indexed in π traversal order.
constexpr std::array<unsigned, 24> kRho = {
    1u, 3u, 6u, 10u, 15u, 21u, 28u, 36u, 45u, 55u, 2u, 14u,
    27u, 41u, 56u, 8u, 25u, 43u, 62u, 18u, 39u, 61u, 20u, 44u,
};

// FIPS 202 §3.2.3: π lane permutation (destination lane for each step).
constexpr std::array<unsigned, 24> kPi = {
    10u, 7u, 11u, 17u, 18u, 3u, 5u, 16u, 8u, 21u, 24u, 4u,
    15u, 23u, 19u, 13u, 12u, 2u, 20u, 14u, 22u, 9u, 6u, 1u,
};

constexpr std::uint64_t rotl64(std::uint64_t x, unsigned n) noexcept {
  return (x << n) | (x >> (64u - n));
}

void keccak_f1600(std::array<std::uint64_t, 25>& a) noexcept {
  for (unsigned round = 0; round < kRounds; ++round) {
    // θ
    std::array<std::uint64_t, 5> c{};
    for (unsigned x = 0; x < 5u; ++x) {
      c[x] = a[x] ^ a[x + 5u] ^ a[x + 10u] ^ a[x + 15u] ^ a[x + 20u];
    }
    for (unsigned x = 0; x < 5u; ++x) {
      const std::uint64_t d = c[(x + 4u) % 5u] ^ rotl64(c[(x + 1u) % 5u], 1u);
      for (unsigned y = 0; y < 25u; y += 5u) {
        a[y + x] ^= d;
      }
    }

    // ρ and π
    std::uint64_t current = a[1];
    for (unsigned i = 0; i < 24u; ++i) {
      const unsigned j = kPi[i];
      const std::uint64_t tmp = a[j];
      a[j] = rotl64(current, kRho[i]);
      current = tmp;
    }

    // χ
    for (unsigned y = 0; y < 25u; y += 5u) {
      std::array<std::uint64_t, 5> row{};
      for (unsigned x = 0; x < 5u; ++x) {
        row[x] = a[y + x];
      }
      for (unsigned x = 0; x < 5u; ++x) {
        a[y + x] = row[x] ^ (~row[(x + 1u) % 5u] & row[(x + 2u) % 5u]);
      }
    }

    // ι
    a[0] ^= kRoundConstants[round];
  }
}

// XOR a rate-sized block into the state; lanes are little-endian.
void absorb_block(std::array<std::uint64_t, 25>& state, const std::uint8_t* block) noexcept {
  for (std::size_t i = 0; i < kRateBytes / 8u; ++i) {
    std::uint64_t lane = 0;
    for (unsigned b = 0; b < 8u; ++b) {
      lane |= static_cast<std::uint64_t>(block[i * 8u + b]) << (8u * b);
    }
    state[i] ^= lane;
  }
  keccak_f1600(state);
}

}  // namespace

Sha3_512Digest sha3_512_digest(std::string_view input) {
  std::array<std::uint64_t, 25> state{};

  const auto* data = reinterpret_cast<const std::uint8_t*>(input.data());
  std::size_t remaining = input.size();
  while (remaining >= kRateBytes) {
    absorb_block(state, data);
    data += kRateBytes;
    remaining -= kRateBytes;
  }

  // FIPS 202 §B.2: SHA-3 domain suffix 01 followed by pad10*1.
  std::array<std::uint8_t, kRateBytes> last{};
  for (std::size_t i = 0; i < remaining; ++i) {
    last[i] = data[i];
  }
  last[remaining] ^= 0x06u;
  last[kRateBytes - 1u] ^= 0x80u;
  absorb_block(state, last.data());

  // 512-bit output fits inside one rate block: squeeze the first 8 lanes.
  Sha3_512Digest digest{};
  for (std::size_t i = 0; i < digest.size(); ++i) {
    digest[i] = static_cast<std::uint8_t>(state[i / 8u] >> (8u * (i % 8u)));
  }
  return digest;
}

}  // namespace idforge::core
