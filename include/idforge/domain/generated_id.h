#pragma once

#include "idforge/core/result.h"
#include "idforge/domain/id_type.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace idforge::domain {

// Binary UUID / ULID layout, big-endian.
using UuidBytes = std::array<std::uint8_t, 16>;

// GeneratedId is the engine's output for a single identifier.
//
// raw holds the binary layout: 16 bytes for UUID and ULID, 12 bytes for ObjectID.
// CUID and NanoID have no binary form; raw holds their symbol sequence.
// canonical is the native text form (UUIDs hyphenated; see FormatCodec for others).
// warning is set when generation recovered from a condition the caller should hear
// about (currently only kClockRegression); the identifier itself is valid.
struct GeneratedId {
  IdType type{IdType::kUuid};                      // NOLINT(readability-identifier-naming)
  std::optional<int> version;                      // NOLINT(readability-identifier-naming)
  std::vector<std::uint8_t> raw;                   // NOLINT(readability-identifier-naming)
  std::string canonical;                           // NOLINT(readability-identifier-naming)
  std::optional<core::GenerationError> warning;    // NOLINT(readability-identifier-naming)
};

}  // namespace idforge::domain
