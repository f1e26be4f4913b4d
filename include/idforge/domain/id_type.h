#pragma once

#include <optional>
#include <string>

namespace idforge::domain {

// IdType enumerates the identifier families the engine can generate and classify.
// Versions (UUID v1/v3/v4/v5, CUID v1/v2) are carried separately.
enum class IdType {
  kUuid,      // NOLINT(readability-identifier-naming)
  kObjectId,  // NOLINT(readability-identifier-naming)
  kNanoId,    // NOLINT(readability-identifier-naming)
  kCuid,      // NOLINT(readability-identifier-naming)
  kUlid,      // NOLINT(readability-identifier-naming)
};

// UuidFormat selects the textual rendering of UUIDs. Other types ignore it.
enum class UuidFormat {
  kHyphenated,  // NOLINT(readability-identifier-naming)
  kSimple,      // NOLINT(readability-identifier-naming)
  kUrn,         // NOLINT(readability-identifier-naming)
};

// Display name used in inspection output: "UUID", "ObjectID", "NanoID", "CUID", "ULID".
[[nodiscard]] std::string id_type_to_string(IdType type);

// Accepts the lowercase machine names: "uuid", "objectid", "nanoid", "cuid", "ulid".
[[nodiscard]] std::optional<IdType> string_to_id_type(const std::string& str);

[[nodiscard]] std::string uuid_format_to_string(UuidFormat format);

}  // namespace idforge::domain
