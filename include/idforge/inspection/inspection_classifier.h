#pragma once

#include "idforge/domain/classification.h"

#include <string_view>
#include <vector>

namespace idforge::inspection {

constexpr int kNanoIdMinPlausibleLength = 21;
constexpr int kNanoIdMaxPlausibleLength = 32;
constexpr int kCuid2MinPlausibleLength = 24;
constexpr int kCuid2MaxPlausibleLength = 32;

// inspect classifies an arbitrary string against every supported identifier scheme.
//
// Screening is structural (length, character class, version/variant bits) followed by
// field decoding where the scheme embeds recoverable data (UUID v1, ObjectID, ULID,
// CUID v1). Candidates are ordered by confidence, then by scheme specificity:
// UUID, ObjectID, ULID, CUID v1, CUID v2, NanoID. NanoID is only offered when no
// other scheme matched, since its alphabet covers most short identifiers.
//
// Pure function of input. An empty result means "unknown"; it is not an error.
[[nodiscard]] std::vector<domain::ClassificationCandidate> inspect(std::string_view input);

}  // namespace idforge::inspection
