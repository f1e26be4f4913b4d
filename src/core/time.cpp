#include "idforge/core/time.h"

#include <iomanip>
#include <sstream>

namespace idforge::core {

namespace {

constexpr std::int64_t kMillisPerDay = 86'400'000;
constexpr std::int64_t kPlausibleLowerMillis = 946'684'800'000;    // 2000-01-01T00:00:00Z
constexpr std::int64_t kPlausibleUpperMillis = 4'102'444'800'000;  // 2100-01-01T00:00:00Z

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

// Days since 1970-01-01 to proleptic Gregorian date (H. Hinnant, "chrono-Compatible
// Low-Level Date Algorithms").
CivilDate civil_from_days(std::int64_t z) noexcept {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

}  // namespace

std::string format_rfc3339_millis(const std::int64_t unix_millis) {
  std::int64_t days = unix_millis / kMillisPerDay;
  std::int64_t rem = unix_millis % kMillisPerDay;
  if (rem < 0) {
    rem += kMillisPerDay;
    --days;
  }

  const CivilDate date = civil_from_days(days);
  const auto hours = rem / 3'600'000;
  const auto minutes = (rem / 60'000) % 60;
  const auto seconds = (rem / 1000) % 60;
  const auto millis = rem % 1000;

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
      << '-' << std::setw(2) << date.day << 'T' << std::setw(2) << hours << ':' << std::setw(2)
      << minutes << ':' << std::setw(2) << seconds << '.' << std::setw(3) << millis << 'Z';
  return oss.str();
}

bool is_plausible_unix_millis(const std::int64_t unix_millis) {
  return unix_millis >= kPlausibleLowerMillis && unix_millis < kPlausibleUpperMillis;
}

}  // namespace idforge::core
