#pragma once

#include "idforge/domain/id_type.h"

#include <map>
#include <optional>
#include <string>

namespace idforge::domain {

// Confidence ranks structurally valid interpretations of a string.
// Declaration order is the ranking order: kHigh outranks kMedium outranks kLow.
enum class Confidence {
  kLow,     // NOLINT(readability-identifier-naming)
  kMedium,  // NOLINT(readability-identifier-naming)
  kHigh,    // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string confidence_to_string(Confidence confidence);

// ClassificationCandidate is one interpretation of an inspected string.
//
// decoded maps field names (embedded_timestamp, node_id, clock_sequence, ...) to values.
// Timestamp fields are present only when the scheme embeds recoverable time bits.
// std::map keeps the keys sorted so rendered output is deterministic.
struct ClassificationCandidate {
  IdType type{IdType::kUuid};                 // NOLINT(readability-identifier-naming)
  std::optional<int> version;                 // NOLINT(readability-identifier-naming)
  Confidence confidence{Confidence::kLow};    // NOLINT(readability-identifier-naming)
  std::map<std::string, std::string> decoded;  // NOLINT(readability-identifier-naming)
};

}  // namespace idforge::domain
