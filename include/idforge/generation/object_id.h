#pragma once

#include "idforge/core/node_identity.h"

#include <array>
#include <cstdint>

namespace idforge::generation {

using ObjectIdBytes = std::array<std::uint8_t, 12>;

// object_id lays out a 12-byte ObjectID:
//   bytes 0..3   big-endian Unix seconds
//   bytes 4..8   per-session random value
//   bytes 9..11  big-endian 24-bit counter
[[nodiscard]] ObjectIdBytes object_id(std::uint32_t unix_seconds,
                                      const core::SessionBytes& session, std::uint32_t counter);

}  // namespace idforge::generation
