#include "idforge/format/encoding.h"

#include <algorithm>

namespace idforge::format {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

int base36_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 10;
  }
  return -1;
}

// Crockford decode: folds lower case, rejects the excluded letters.
int crockford_value(char ch) {
  if (ch >= 'a' && ch <= 'z') {
    ch = static_cast<char>(ch - ('a' - 'A'));
  }
  const auto pos = kCrockfordAlphabet.find(ch);
  if (pos == std::string_view::npos) {
    return -1;
  }
  return static_cast<int>(pos);
}

}  // namespace

std::string hex_encode(std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2u);
  for (const std::uint8_t b : bytes) {
    out.push_back(kHexDigits[b >> 4u]);
    out.push_back(kHexDigits[b & 0x0fu]);
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> hex_decode(std::string_view text) {
  if (text.size() % 2u != 0u) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out;
  out.reserve(text.size() / 2u);
  for (std::size_t i = 0; i < text.size(); i += 2u) {
    const int hi = hex_value(text[i]);
    const int lo = hex_value(text[i + 1u]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

bool is_hex(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](const char ch) { return hex_value(ch) >= 0; });
}

std::string to_base36(std::uint64_t value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(kBase36Alphabet[value % 36u]);
    value /= 36u;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string bytes_to_base36(std::span<const std::uint8_t> big_endian) {
  // Schoolbook long division by 36 over the big-endian digits.
  std::vector<std::uint8_t> digits(big_endian.begin(), big_endian.end());
  std::string out;

  auto first_nonzero = std::find_if(digits.begin(), digits.end(),
                                    [](const std::uint8_t b) { return b != 0u; });
  while (first_nonzero != digits.end()) {
    unsigned remainder = 0;
    for (auto it = first_nonzero; it != digits.end(); ++it) {
      const unsigned acc = (remainder << 8u) | *it;
      *it = static_cast<std::uint8_t>(acc / 36u);
      remainder = acc % 36u;
    }
    out.push_back(kBase36Alphabet[remainder]);
    first_nonzero = std::find_if(first_nonzero, digits.end(),
                                 [](const std::uint8_t b) { return b != 0u; });
  }

  if (out.empty()) {
    return "0";
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<std::uint64_t> parse_base36(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char ch : text) {
    const int digit = base36_value(ch);
    if (digit < 0) {
      return std::nullopt;
    }
    if (value > (UINT64_MAX - static_cast<std::uint64_t>(digit)) / 36u) {
      return std::nullopt;
    }
    value = value * 36u + static_cast<std::uint64_t>(digit);
  }
  return value;
}

bool is_base36_lower(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](const char ch) { return base36_value(ch) >= 0; });
}

std::string pad_base36(std::string_view text, const std::size_t width) {
  if (text.size() >= width) {
    return std::string{text.substr(text.size() - width)};
  }
  return std::string(width - text.size(), '0') + std::string{text};
}

std::string crockford_encode(const std::array<std::uint8_t, 16>& bytes) {
  // 26 symbols carry 130 bits; the value occupies the low 128, so bit positions are
  // shifted by two relative to the byte array.
  std::string out;
  out.reserve(26u);
  for (int i = 0; i < 26; ++i) {
    unsigned symbol = 0;
    for (int j = 0; j < 5; ++j) {
      const int pos = i * 5 + j - 2;
      unsigned bit = 0;
      if (pos >= 0) {
        bit = (bytes[static_cast<std::size_t>(pos / 8)] >> (7 - pos % 8)) & 0x01u;
      }
      symbol = (symbol << 1u) | bit;
    }
    out.push_back(kCrockfordAlphabet[symbol]);
  }
  return out;
}

std::optional<std::array<std::uint8_t, 16>> crockford_decode(std::string_view text) {
  if (text.size() != 26u) {
    return std::nullopt;
  }

  std::array<std::uint8_t, 16> bytes{};
  for (int i = 0; i < 26; ++i) {
    const int symbol = crockford_value(text[static_cast<std::size_t>(i)]);
    if (symbol < 0 || (i == 0 && symbol > 7)) {
      return std::nullopt;
    }
    for (int j = 0; j < 5; ++j) {
      const int pos = i * 5 + j - 2;
      if (pos < 0) {
        continue;
      }
      const unsigned bit = (static_cast<unsigned>(symbol) >> (4 - j)) & 0x01u;
      bytes[static_cast<std::size_t>(pos / 8)] |=
          static_cast<std::uint8_t>(bit << (7 - pos % 8));
    }
  }
  return bytes;
}

}  // namespace idforge::format
