#include "idforge/format/format_codec.h"

#include "idforge/core/normalization.h"
#include "idforge/format/encoding.h"

#include <algorithm>
#include <iterator>

namespace idforge::format {

namespace {

constexpr std::size_t kSimpleLength = 32;
constexpr std::size_t kHyphenatedLength = 36;

bool hyphens_at_canonical_positions(std::string_view text) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool expected = (i == 8 || i == 13 || i == 18 || i == 23);
    if ((text[i] == '-') != expected) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string format_uuid(const domain::UuidBytes& bytes, const domain::UuidFormat format) {
  const std::string simple = hex_encode(bytes);
  if (format == domain::UuidFormat::kSimple) {
    return simple;
  }

  std::string hyphenated;
  hyphenated.reserve(kHyphenatedLength);
  hyphenated.append(simple, 0, 8).push_back('-');
  hyphenated.append(simple, 8, 4).push_back('-');
  hyphenated.append(simple, 12, 4).push_back('-');
  hyphenated.append(simple, 16, 4).push_back('-');
  hyphenated.append(simple, 20, 12);

  if (format == domain::UuidFormat::kUrn) {
    return std::string{kUrnPrefix} + hyphenated;
  }
  return hyphenated;
}

std::optional<domain::UuidBytes> parse_uuid(std::string_view text) {
  if (core::starts_with_ascii_ci(text, kUrnPrefix)) {
    text.remove_prefix(kUrnPrefix.size());
  } else if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
    text = text.substr(1, text.size() - 2);
  }

  std::string digits;
  if (text.size() == kHyphenatedLength) {
    if (!hyphens_at_canonical_positions(text)) {
      return std::nullopt;
    }
    std::copy_if(text.begin(), text.end(), std::back_inserter(digits),
                 [](const char ch) { return ch != '-'; });
  } else if (text.size() == kSimpleLength) {
    digits = std::string{text};
  } else {
    return std::nullopt;
  }

  const auto decoded = hex_decode(digits);
  if (!decoded.has_value() || decoded->size() != 16u) {
    return std::nullopt;
  }

  domain::UuidBytes bytes{};
  std::copy(decoded->begin(), decoded->end(), bytes.begin());
  return bytes;
}

std::string render(const domain::GeneratedId& id, const domain::UuidFormat format,
                   const std::string_view prefix, const std::string_view suffix) {
  std::string body;
  if (id.type == domain::IdType::kUuid && id.raw.size() == 16u) {
    domain::UuidBytes bytes{};
    std::copy(id.raw.begin(), id.raw.end(), bytes.begin());
    body = format_uuid(bytes, format);
  } else {
    body = id.canonical;
  }

  std::string out;
  out.reserve(prefix.size() + body.size() + suffix.size());
  out.append(prefix);
  out.append(body);
  out.append(suffix);
  return out;
}

}  // namespace idforge::format
