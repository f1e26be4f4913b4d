#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace idforge::core {

using Sha1Digest = std::array<std::uint8_t, 20>;

// sha1_digest returns the 20-byte SHA-1 digest of input.
//
// Implements FIPS 180-4 SHA-1. Used only for name-based UUID v5.
[[nodiscard]] Sha1Digest sha1_digest(std::string_view input);

}  // namespace idforge::core
