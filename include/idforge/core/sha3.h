#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace idforge::core {

using Sha3_512Digest = std::array<std::uint8_t, 64>;

// sha3_512_digest returns the 64-byte SHA3-512 digest of input.
//
// Implements FIPS 202 (Keccak-f[1600], rate 576 bits, domain suffix 0b01).
// CUID v2 hashes its entropy through this function.
[[nodiscard]] Sha3_512Digest sha3_512_digest(std::string_view input);

}  // namespace idforge::core
