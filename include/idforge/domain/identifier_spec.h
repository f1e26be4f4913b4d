#pragma once

#include "idforge/domain/id_type.h"

#include <optional>
#include <string>

namespace idforge::domain {

constexpr int kDefaultUuidVersion = 4;
constexpr int kDefaultCuidVersion = 2;
constexpr int kDefaultNanoIdLength = 21;
constexpr int kDefaultCuid2Length = 24;

// IdentifierSpec describes one generation request.
// Constructed by the caller per generate() call and treated as immutable by the engine.
//
// - version: UUID 1/3/4/5 (default 4), CUID 1/2 (default 2); must be absent for other types
// - id_namespace/name: required for UUID v3/v5, ignored otherwise
// - length: NanoID (default 21) and CUID v2 (default 24) only; signed so that
//   negative requests reach validation instead of wrapping
// - format: UUID rendering; prefix/suffix are concatenated verbatim
struct IdentifierSpec {
  IdType type{IdType::kUuid};                // NOLINT(readability-identifier-naming)
  std::optional<int> version;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> id_namespace;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> name;           // NOLINT(readability-identifier-naming)
  std::optional<int> length;                 // NOLINT(readability-identifier-naming)
  UuidFormat format{UuidFormat::kHyphenated};  // NOLINT(readability-identifier-naming)
  std::string prefix;                        // NOLINT(readability-identifier-naming)
  std::string suffix;                        // NOLINT(readability-identifier-naming)
};

}  // namespace idforge::domain
