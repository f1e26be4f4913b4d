#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace idforge::format {

// Crockford base32 symbol set: digits plus uppercase letters without I, L, O, U.
constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Lower-case base36 symbol set used by CUID.
constexpr std::string_view kBase36Alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

// ── Hex ─────────────────────────────────────────────────────────────────────

[[nodiscard]] std::string hex_encode(std::span<const std::uint8_t> bytes);

// Accepts upper- or lower-case digits. Returns nullopt on odd length or a non-hex char.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_decode(std::string_view text);

[[nodiscard]] bool is_hex(std::string_view text);

// ── Base36 ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::string to_base36(std::uint64_t value);

// Big-endian byte string interpreted as one unsigned integer, rendered in base36.
// An all-zero input renders as "0".
[[nodiscard]] std::string bytes_to_base36(std::span<const std::uint8_t> big_endian);

// Parses lower-case base36. Returns nullopt on empty input, bad chars or overflow.
[[nodiscard]] std::optional<std::uint64_t> parse_base36(std::string_view text);

[[nodiscard]] bool is_base36_lower(std::string_view text);

// pad_base36 left-pads with '0' to width and keeps the rightmost width chars,
// so over-long values are truncated from the left.
[[nodiscard]] std::string pad_base36(std::string_view text, std::size_t width);

// ── Crockford base32 ────────────────────────────────────────────────────────

// Encodes 128 bits as 26 upper-case chars (two leading zero pad bits).
[[nodiscard]] std::string crockford_encode(const std::array<std::uint8_t, 16>& bytes);

// Decodes 26 Crockford chars, case-insensitively. Rejects I, L, O, U and a first char
// above '7' (the value would not fit in 128 bits).
[[nodiscard]] std::optional<std::array<std::uint8_t, 16>> crockford_decode(std::string_view text);

}  // namespace idforge::format
