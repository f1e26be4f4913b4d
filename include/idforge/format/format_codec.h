#pragma once

#include "idforge/domain/generated_id.h"
#include "idforge/domain/id_type.h"

#include <optional>
#include <string>
#include <string_view>

namespace idforge::format {

constexpr std::string_view kUrnPrefix = "urn:uuid:";

// format_uuid renders 16 bytes as lower-case text:
//   kHyphenated  xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
//   kSimple      32 hex chars
//   kUrn         urn:uuid:<hyphenated>
[[nodiscard]] std::string format_uuid(const domain::UuidBytes& bytes, domain::UuidFormat format);

// parse_uuid accepts the hyphenated (hyphens only at 8-4-4-4-12), simple, URN
// ("urn:uuid:" in any case) and braced ("{...}") forms, in either hex case.
// Surrounding whitespace is not accepted. Version and variant are not checked.
[[nodiscard]] std::optional<domain::UuidBytes> parse_uuid(std::string_view text);

// render produces the display text of a generated identifier.
// format only affects UUIDs; prefix and suffix are concatenated verbatim.
[[nodiscard]] std::string render(const domain::GeneratedId& id, domain::UuidFormat format,
                                 std::string_view prefix, std::string_view suffix);

}  // namespace idforge::format
