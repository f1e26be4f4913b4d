#include "idforge/generation/uuid.h"

#include "idforge/core/md5.h"
#include "idforge/core/normalization.h"
#include "idforge/core/sha1.h"
#include "idforge/format/format_codec.h"

#include <algorithm>
#include <string>

namespace idforge::generation {

namespace {

std::string name_input(const domain::UuidBytes& ns, std::string_view name) {
  std::string input(ns.begin(), ns.end());
  input.append(name);
  return input;
}

}  // namespace

std::optional<domain::UuidBytes> resolve_namespace(std::string_view text) {
  const std::string upper = core::normalize_ascii_upper(text);
  if (upper == "DNS") {
    return kNamespaceDns;
  }
  if (upper == "URL") {
    return kNamespaceUrl;
  }
  if (upper == "OID") {
    return kNamespaceOid;
  }
  if (upper == "X500") {
    return kNamespaceX500;
  }
  return format::parse_uuid(text);
}

void apply_version_and_variant(domain::UuidBytes& bytes, const int version) noexcept {
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0fu) | ((version & 0x0f) << 4));
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3fu) | 0x80u);
}

domain::UuidBytes uuid_v1(const std::uint64_t gregorian_ticks, const std::uint16_t clock_seq,
                          const core::NodeId& node) {
  const auto time_low = static_cast<std::uint32_t>(gregorian_ticks & 0xffffffffu);
  const auto time_mid = static_cast<std::uint16_t>((gregorian_ticks >> 32u) & 0xffffu);
  const auto time_hi = static_cast<std::uint16_t>((gregorian_ticks >> 48u) & 0x0fffu);

  domain::UuidBytes bytes{};
  bytes[0] = static_cast<std::uint8_t>(time_low >> 24u);
  bytes[1] = static_cast<std::uint8_t>(time_low >> 16u);
  bytes[2] = static_cast<std::uint8_t>(time_low >> 8u);
  bytes[3] = static_cast<std::uint8_t>(time_low);
  bytes[4] = static_cast<std::uint8_t>(time_mid >> 8u);
  bytes[5] = static_cast<std::uint8_t>(time_mid);
  bytes[6] = static_cast<std::uint8_t>(time_hi >> 8u);
  bytes[7] = static_cast<std::uint8_t>(time_hi);
  bytes[8] = static_cast<std::uint8_t>((clock_seq >> 8u) & 0x3fu);
  bytes[9] = static_cast<std::uint8_t>(clock_seq);
  std::copy(node.begin(), node.end(), bytes.begin() + 10);

  apply_version_and_variant(bytes, 1);
  return bytes;
}

domain::UuidBytes uuid_v3(const domain::UuidBytes& ns, std::string_view name) {
  const core::Md5Digest digest = core::md5_digest(name_input(ns, name));
  domain::UuidBytes bytes{};
  std::copy(digest.begin(), digest.end(), bytes.begin());
  apply_version_and_variant(bytes, 3);
  return bytes;
}

domain::UuidBytes uuid_v5(const domain::UuidBytes& ns, std::string_view name) {
  const core::Sha1Digest digest = core::sha1_digest(name_input(ns, name));
  domain::UuidBytes bytes{};
  std::copy_n(digest.begin(), bytes.size(), bytes.begin());
  apply_version_and_variant(bytes, 5);
  return bytes;
}

domain::UuidBytes uuid_v4(domain::UuidBytes random_bytes) {
  apply_version_and_variant(random_bytes, 4);
  return random_bytes;
}

}  // namespace idforge::generation
