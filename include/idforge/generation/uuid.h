#pragma once

#include "idforge/core/node_identity.h"
#include "idforge/domain/generated_id.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace idforge::generation {

// RFC 4122 Appendix C: predefined namespace ids.
constexpr domain::UuidBytes kNamespaceDns = {0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                                             0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
constexpr domain::UuidBytes kNamespaceUrl = {0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                                             0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
constexpr domain::UuidBytes kNamespaceOid = {0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                                             0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
constexpr domain::UuidBytes kNamespaceX500 = {0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                              0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

// resolve_namespace maps "DNS", "URL", "OID", "X500" (any case) to their predefined ids
// and otherwise parses text as a UUID. Returns nullopt when neither applies.
[[nodiscard]] std::optional<domain::UuidBytes> resolve_namespace(std::string_view text);

// Overwrites the version nibble (byte 6) and the variant bits (byte 8, `10`).
void apply_version_and_variant(domain::UuidBytes& bytes, int version) noexcept;

// uuid_v1 lays out time_low | time_mid | time_hi_and_version | clock_seq | node.
[[nodiscard]] domain::UuidBytes uuid_v1(std::uint64_t gregorian_ticks, std::uint16_t clock_seq,
                                        const core::NodeId& node);

// Name-based UUIDs: hash(namespace bytes ‖ name bytes), truncated to 16 bytes.
[[nodiscard]] domain::UuidBytes uuid_v3(const domain::UuidBytes& ns, std::string_view name);
[[nodiscard]] domain::UuidBytes uuid_v5(const domain::UuidBytes& ns, std::string_view name);

// uuid_v4 stamps version and variant onto 16 random bytes.
[[nodiscard]] domain::UuidBytes uuid_v4(domain::UuidBytes random_bytes);

}  // namespace idforge::generation
