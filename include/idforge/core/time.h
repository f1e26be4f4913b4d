#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace idforge::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Offset between the Gregorian epoch (1582-10-15) and the Unix epoch, in 100 ns ticks.
constexpr std::uint64_t kGregorianEpochOffsetTicks = 0x01B21DD213814000ull;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_seconds(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// to_gregorian_ticks returns 100 ns intervals since 1582-10-15T00:00:00Z (RFC 4122 §4.1.4).
inline std::uint64_t to_gregorian_ticks(const Timestamp ts) {
  using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;
  const auto ticks = std::chrono::duration_cast<Ticks>(ts.time_since_epoch()).count();
  return static_cast<std::uint64_t>(ticks) + kGregorianEpochOffsetTicks;
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// format_rfc3339_millis renders a Unix millisecond value as "YYYY-MM-DDTHH:MM:SS.mmmZ".
// Uses civil-from-days arithmetic so results do not depend on the host time zone
// database or on the range of time_t.
[[nodiscard]] std::string format_rfc3339_millis(std::int64_t unix_millis);

// is_plausible_unix_millis reports whether a timestamp falls in [2000-01-01, 2100-01-01).
[[nodiscard]] bool is_plausible_unix_millis(std::int64_t unix_millis);

}  // namespace idforge::core
