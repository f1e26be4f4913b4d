#include "idforge/generation/object_id.h"

#include <algorithm>

namespace idforge::generation {

ObjectIdBytes object_id(const std::uint32_t unix_seconds, const core::SessionBytes& session,
                        const std::uint32_t counter) {
  ObjectIdBytes bytes{};
  bytes[0] = static_cast<std::uint8_t>(unix_seconds >> 24u);
  bytes[1] = static_cast<std::uint8_t>(unix_seconds >> 16u);
  bytes[2] = static_cast<std::uint8_t>(unix_seconds >> 8u);
  bytes[3] = static_cast<std::uint8_t>(unix_seconds);
  std::copy(session.begin(), session.end(), bytes.begin() + 4);
  bytes[9] = static_cast<std::uint8_t>(counter >> 16u);
  bytes[10] = static_cast<std::uint8_t>(counter >> 8u);
  bytes[11] = static_cast<std::uint8_t>(counter);
  return bytes;
}

}  // namespace idforge::generation
