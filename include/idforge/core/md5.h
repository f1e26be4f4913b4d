#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace idforge::core {

using Md5Digest = std::array<std::uint8_t, 16>;

// md5_digest returns the 16-byte MD5 digest of input.
//
// Implements RFC 1321. Used only for name-based UUID v3, never for security.
[[nodiscard]] Md5Digest md5_digest(std::string_view input);

}  // namespace idforge::core
