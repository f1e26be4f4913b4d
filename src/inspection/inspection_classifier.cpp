#include "idforge/inspection/inspection_classifier.h"

#include "idforge/core/normalization.h"
#include "idforge/core/time.h"
#include "idforge/format/encoding.h"
#include "idforge/format/format_codec.h"
#include "idforge/generation/cuid.h"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace idforge::inspection {

namespace {

using domain::ClassificationCandidate;
using domain::Confidence;
using domain::IdType;

constexpr std::size_t kObjectIdLength = 24;
constexpr std::size_t kUlidLength = 26;
constexpr std::size_t kCuid1TimestampWidth = 8;

// Lower rank sorts first among equal confidence.
enum class Specificity {
  kUuid,
  kObjectId,
  kUlid,
  kCuid1,
  kCuid2,
  kNanoId,
};

struct RankedCandidate {
  Specificity specificity;
  ClassificationCandidate candidate;
};

bool is_nanoid_char(const char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '-';
}

Confidence plausibility(const std::int64_t unix_millis, const Confidence otherwise) {
  return core::is_plausible_unix_millis(unix_millis) ? Confidence::kHigh : otherwise;
}

std::string variant_name(const std::uint8_t byte8) {
  if ((byte8 & 0x80u) == 0x00u) {
    return "ncs";
  }
  if ((byte8 & 0xc0u) == 0x80u) {
    return "rfc4122";
  }
  if ((byte8 & 0xe0u) == 0xc0u) {
    return "microsoft";
  }
  return "future";
}

std::string format_node_id(const domain::UuidBytes& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 10; i < 16; ++i) {
    if (i > 10) {
      oss << ':';
    }
    oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
  }
  return oss.str();
}

// ────────────────────────────────────────────────────────────────
// UUID
// ────────────────────────────────────────────────────────────────

void decode_uuid_v1(const domain::UuidBytes& b, ClassificationCandidate& out) {
  const std::uint64_t ticks = (static_cast<std::uint64_t>(b[6] & 0x0fu) << 56u) |
                              (static_cast<std::uint64_t>(b[7]) << 48u) |
                              (static_cast<std::uint64_t>(b[4]) << 40u) |
                              (static_cast<std::uint64_t>(b[5]) << 32u) |
                              (static_cast<std::uint64_t>(b[0]) << 24u) |
                              (static_cast<std::uint64_t>(b[1]) << 16u) |
                              (static_cast<std::uint64_t>(b[2]) << 8u) |
                              static_cast<std::uint64_t>(b[3]);
  // Ticks below the Unix epoch are legal (1582..1970) and produce negative millis.
  const auto unix_ticks =
      static_cast<std::int64_t>(ticks) - static_cast<std::int64_t>(core::kGregorianEpochOffsetTicks);
  std::int64_t unix_millis = unix_ticks / 10'000;
  if (unix_ticks % 10'000 < 0) {
    --unix_millis;
  }
  const unsigned clock_seq = (static_cast<unsigned>(b[8] & 0x3fu) << 8u) | b[9];

  out.decoded["embedded_timestamp"] = core::format_rfc3339_millis(unix_millis);
  out.decoded["unix_millis"] = std::to_string(unix_millis);
  out.decoded["node_id"] = format_node_id(b);
  out.decoded["clock_sequence"] = std::to_string(clock_seq);
}

std::optional<RankedCandidate> classify_uuid(std::string_view text) {
  const auto parsed = format::parse_uuid(text);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  const domain::UuidBytes& bytes = parsed.value();

  ClassificationCandidate c;
  c.type = IdType::kUuid;

  if (std::all_of(bytes.begin(), bytes.end(), [](const std::uint8_t b) { return b == 0u; })) {
    c.confidence = Confidence::kMedium;
    c.decoded["variant"] = "nil";
    return RankedCandidate{Specificity::kUuid, c};
  }

  const int version = bytes[6] >> 4u;
  const std::string variant = variant_name(bytes[8]);
  c.decoded["variant"] = variant;
  c.decoded["version"] = std::to_string(version);

  const bool rfc = variant == "rfc4122";
  const bool known_version = version == 1 || version == 3 || version == 4 || version == 5;
  if (!rfc || !known_version) {
    c.confidence = Confidence::kLow;
    c.decoded["note"] = "hex string, not a valid RFC 4122 UUID";
    return RankedCandidate{Specificity::kUuid, c};
  }

  c.version = version;
  c.confidence = Confidence::kHigh;
  switch (version) {
    case 1:
      decode_uuid_v1(bytes, c);
      break;
    case 3:
      c.decoded["hash_algorithm"] = "md5";
      break;
    case 5:
      c.decoded["hash_algorithm"] = "sha1";
      break;
    default:
      break;
  }
  return RankedCandidate{Specificity::kUuid, c};
}

// ────────────────────────────────────────────────────────────────
// ObjectID
// ────────────────────────────────────────────────────────────────

std::optional<RankedCandidate> classify_object_id(std::string_view text) {
  if (text.size() != kObjectIdLength || !format::is_hex(text)) {
    return std::nullopt;
  }
  const auto bytes = format::hex_decode(text);
  if (!bytes.has_value()) {
    return std::nullopt;
  }
  const auto& b = bytes.value();

  const std::uint32_t seconds = (static_cast<std::uint32_t>(b[0]) << 24u) |
                                (static_cast<std::uint32_t>(b[1]) << 16u) |
                                (static_cast<std::uint32_t>(b[2]) << 8u) |
                                static_cast<std::uint32_t>(b[3]);
  const std::uint32_t counter = (static_cast<std::uint32_t>(b[9]) << 16u) |
                                (static_cast<std::uint32_t>(b[10]) << 8u) |
                                static_cast<std::uint32_t>(b[11]);
  const std::int64_t millis = static_cast<std::int64_t>(seconds) * 1000;

  ClassificationCandidate c;
  c.type = IdType::kObjectId;
  c.confidence = plausibility(millis, Confidence::kLow);
  c.decoded["embedded_timestamp"] = core::format_rfc3339_millis(millis);
  c.decoded["unix_seconds"] = std::to_string(seconds);
  c.decoded["counter"] = std::to_string(counter);
  return RankedCandidate{Specificity::kObjectId, c};
}

// ────────────────────────────────────────────────────────────────
// ULID
// ────────────────────────────────────────────────────────────────

std::optional<RankedCandidate> classify_ulid(std::string_view text) {
  if (text.size() != kUlidLength) {
    return std::nullopt;
  }
  const auto bytes = format::crockford_decode(text);
  if (!bytes.has_value()) {
    return std::nullopt;
  }

  std::int64_t millis = 0;
  for (std::size_t i = 0; i < 6; ++i) {
    millis = (millis << 8) | bytes.value()[i];
  }

  ClassificationCandidate c;
  c.type = IdType::kUlid;
  c.confidence = plausibility(millis, Confidence::kLow);
  c.decoded["embedded_timestamp"] = core::format_rfc3339_millis(millis);
  c.decoded["unix_millis"] = std::to_string(millis);
  return RankedCandidate{Specificity::kUlid, c};
}

// ────────────────────────────────────────────────────────────────
// CUID
// ────────────────────────────────────────────────────────────────

std::optional<RankedCandidate> classify_cuid1(std::string_view text) {
  if (text.size() != generation::kCuid1Length || text.front() != 'c' ||
      !format::is_base36_lower(text.substr(1))) {
    return std::nullopt;
  }
  const auto millis = format::parse_base36(text.substr(1, kCuid1TimestampWidth));
  const auto counter =
      format::parse_base36(text.substr(1 + kCuid1TimestampWidth, generation::kCuid1BlockSize));
  if (!millis.has_value() || !counter.has_value()) {
    return std::nullopt;
  }
  const auto signed_millis = static_cast<std::int64_t>(millis.value());

  ClassificationCandidate c;
  c.type = IdType::kCuid;
  c.version = 1;
  c.confidence = plausibility(signed_millis, Confidence::kMedium);
  c.decoded["embedded_timestamp"] = core::format_rfc3339_millis(signed_millis);
  c.decoded["unix_millis"] = std::to_string(signed_millis);
  c.decoded["counter"] = std::to_string(counter.value());
  c.decoded["fingerprint"] = std::string{text.substr(
      1 + kCuid1TimestampWidth + generation::kCuid1BlockSize, generation::kCuid1BlockSize)};
  return RankedCandidate{Specificity::kCuid1, c};
}

std::optional<RankedCandidate> classify_cuid2(std::string_view text) {
  const auto size = static_cast<int>(text.size());
  if (size < kCuid2MinPlausibleLength || size > kCuid2MaxPlausibleLength) {
    return std::nullopt;
  }
  if (text.front() < 'a' || text.front() > 'z' || !format::is_base36_lower(text)) {
    return std::nullopt;
  }

  ClassificationCandidate c;
  c.type = IdType::kCuid;
  c.version = 2;
  // Base36 hash output that happens to be pure hex is vanishingly rare.
  c.confidence = format::is_hex(text) ? Confidence::kLow : Confidence::kMedium;
  return RankedCandidate{Specificity::kCuid2, c};
}

// ────────────────────────────────────────────────────────────────
// NanoID
// ────────────────────────────────────────────────────────────────

std::optional<RankedCandidate> classify_nanoid(std::string_view text) {
  const auto size = static_cast<int>(text.size());
  if (size < kNanoIdMinPlausibleLength || size > kNanoIdMaxPlausibleLength) {
    return std::nullopt;
  }
  if (!std::all_of(text.begin(), text.end(), is_nanoid_char)) {
    return std::nullopt;
  }

  ClassificationCandidate c;
  c.type = IdType::kNanoId;
  c.confidence = Confidence::kLow;
  return RankedCandidate{Specificity::kNanoId, c};
}

}  // namespace

std::vector<ClassificationCandidate> inspect(std::string_view input) {
  const std::string text = core::trim(input);
  if (text.empty()) {
    return {};
  }

  std::vector<RankedCandidate> found;
  for (const auto& classify :
       {classify_uuid, classify_object_id, classify_ulid, classify_cuid1, classify_cuid2}) {
    if (auto candidate = classify(text)) {
      found.push_back(std::move(candidate.value()));
    }
  }
  if (found.empty()) {
    if (auto candidate = classify_nanoid(text)) {
      found.push_back(std::move(candidate.value()));
    }
  }

  std::stable_sort(found.begin(), found.end(),
                   [](const RankedCandidate& a, const RankedCandidate& b) {
                     if (a.candidate.confidence != b.candidate.confidence) {
                       return a.candidate.confidence > b.candidate.confidence;
                     }
                     return a.specificity < b.specificity;
                   });

  std::vector<ClassificationCandidate> result;
  result.reserve(found.size());
  for (auto& ranked : found) {
    result.push_back(std::move(ranked.candidate));
  }
  return result;
}

}  // namespace idforge::inspection
