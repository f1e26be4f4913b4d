#include "idforge/domain/id_type.h"

namespace idforge::domain {

std::string id_type_to_string(IdType type) {
  switch (type) {
    case IdType::kUuid:
      return "UUID";
    case IdType::kObjectId:
      return "ObjectID";
    case IdType::kNanoId:
      return "NanoID";
    case IdType::kCuid:
      return "CUID";
    case IdType::kUlid:
      return "ULID";
  }
  return "Unknown";
}

std::optional<IdType> string_to_id_type(const std::string& str) {
  if (str == "uuid") {
    return IdType::kUuid;
  }
  if (str == "objectid") {
    return IdType::kObjectId;
  }
  if (str == "nanoid") {
    return IdType::kNanoId;
  }
  if (str == "cuid") {
    return IdType::kCuid;
  }
  if (str == "ulid") {
    return IdType::kUlid;
  }
  return std::nullopt;
}

std::string uuid_format_to_string(UuidFormat format) {
  switch (format) {
    case UuidFormat::kHyphenated:
      return "hyphenated";
    case UuidFormat::kSimple:
      return "simple";
    case UuidFormat::kUrn:
      return "urn";
  }
  return "unknown";
}

}  // namespace idforge::domain
